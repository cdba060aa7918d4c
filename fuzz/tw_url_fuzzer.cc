#include <tokwh/TWExc.hh>
#include <tokwh/TWURL.hh>

#include <iostream>
#include <stdexcept>

class FuzzHelper
{
  public:
    FuzzHelper(unsigned char const* data, size_t size);
    void run();

  private:
    void doChecks();

    unsigned char const* data;
    size_t size;
};

FuzzHelper::FuzzHelper(unsigned char const* data, size_t size) :
    data(data),
    size(size)
{
}

void
FuzzHelper::doChecks()
{
    std::string url(reinterpret_cast<char const*>(data), size);
    auto first = TWURL::tryNormalize(url);
    auto second = TWURL::tryNormalize(url);
    if (first != second) {
        throw std::logic_error("URL normalization is not deterministic");
    }
    if (first) {
        // A normalized URL never contains control characters.
        for (auto ch: first->normalized) {
            auto c = static_cast<unsigned char>(ch);
            if (c < 0x20 || c == 0x7f) {
                throw std::logic_error("control character in normalized URL");
            }
        }
    }
}

void
FuzzHelper::run()
{
    try {
        doChecks();
    } catch (TWExc const& e) {
        std::cerr << "TWExc: " << e.what() << '\n';
    }
}

extern "C" int
LLVMFuzzerTestOneInput(unsigned char const* data, size_t size)
{
    FuzzHelper f(data, size);
    f.run();
    return 0;
}
