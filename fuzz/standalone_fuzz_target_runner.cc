#include <tokwh/TWUtil.hh>

#include <iostream>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(unsigned char const* data, size_t size);

int
main(int argc, char** argv)
{
    for (int i = 1; i < argc; i++) {
        auto input = TWUtil::read_file_into_string(argv[i]);
        LLVMFuzzerTestOneInput(reinterpret_cast<unsigned char const*>(input.data()), input.size());
        std::cout << argv[i] << " successful" << std::endl;
    }
    return 0;
}
