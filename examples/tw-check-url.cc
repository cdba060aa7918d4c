#include <tokwh/TWConfig.hh>
#include <tokwh/TWURL.hh>
#include <tokwh/TWUtil.hh>

#include <cstdlib>
#include <cstring>
#include <iostream>

// A downstream consumer of collected URLs, such as a link checker or an image fetcher, must
// judge URLs with the same function the collectors used. This program shows that call site: it
// reads the scheme policy from the environment and prints one verdict per URL.

static char const* whoami = nullptr;

void
usage()
{
    std::cerr << "Usage: " << whoami << " url ...\n"
              << "Prints \"allow\" or \"deny\" and the normalized form of each url\n";
    exit(2);
}

int
main(int argc, char* argv[])
{
    whoami = TWUtil::getWhoami(argv[0]);

    if ((argc == 2) && (strcmp(argv[1], "--version") == 0)) {
        std::cout << whoami << " version 1.0\n";
        exit(0);
    }
    if (argc < 2) {
        usage();
    }

    int status = 0;
    try {
        auto config = TWConfig::fromEnvironment();
        for (int i = 1; i < argc; ++i) {
            auto result = TWURL::tryNormalize(argv[i], config);
            if (!result) {
                std::cout << "deny  (invalid) " << argv[i] << '\n';
                status = 3;
            } else if (result->allowed) {
                std::cout << "allow " << result->normalized << '\n';
            } else {
                std::cout << "deny  " << result->normalized << '\n';
                status = 3;
            }
        }
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << '\n';
        exit(2);
    }
    return status;
}
