#include <tokwh/TWJSONNode.hh>
#include <tokwh/TWUtil.hh>
#include <tokwh/TokenWarehouse.hh>

#include <cstdlib>
#include <cstring>
#include <iostream>

static char const* whoami = nullptr;

void
usage()
{
    std::cerr << "Usage: " << whoami << " tokens.json [source.md]\n"
              << "Prints the section table of a markdown-it token dump\n";
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
    if (argc < 2 || argc > 3) {
        usage();
    }

    try {
        auto nodes = TWJSONNode::parseDocument(TWUtil::read_file_into_string(argv[1]));
        std::string text;
        if (argc == 3) {
            text = TWUtil::read_file_into_string(argv[2]);
        }
        TokenWarehouse w(nodes, TWConfig(), text);
        auto const& sections = w.getSections();
        for (size_t i = 0; i < sections.size(); ++i) {
            auto const& s = sections[i];
            std::cout << i << ": lines " << s.start_line << "-" << s.end_line;
            if (s.heading_index) {
                std::cout << " h" << s.level << " " << s.title;
                if (!text.empty()) {
                    std::cout << " [" << w.lineText(s.start_line) << "]";
                }
            } else {
                std::cout << " (preamble)";
            }
            std::cout << '\n';
        }
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << '\n';
        exit(2);
    }
    return 0;
}
