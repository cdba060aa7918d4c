#ifndef TWINDEXBUILDER_HH
#define TWINDEXBUILDER_HH

#include <tokwh/TWSection.hh>
#include <tokwh/TWTokenView.hh>

#include <map>
#include <optional>
#include <string>
#include <vector>

// Index tables over a flattened token list, built in one forward pass with explicit stacks.
class TWIndexBuilder
{
  public:
    static size_t constexpr none = static_cast<size_t>(-1);

    struct Tables
    {
        std::map<std::string, std::vector<size_t>> by_type;
        // Matching open/close index or none.
        std::vector<size_t> pairs;
        // Innermost enclosing open token or child container, or none.
        std::vector<size_t> parents;
        // Own map start, else the nearest ancestor's.
        std::vector<std::optional<long long>> lines;
        std::vector<TWSection> sections;
        std::vector<TWFence> fences;
        std::vector<std::string> text_lines;
        long long line_count{0};
    };

    static Tables build(std::vector<TWTokenView> const& tokens, std::string const& text);

    // Whether the open/close stack the index pass keeps ever holds more than max_nesting frames.
    // Unmatched opens stay on the stack, and each child level adds one frame.
    static bool exceedsNesting(std::vector<TWTokenView> const& tokens, size_t max_nesting);

  private:
    static void buildStructure(std::vector<TWTokenView> const& tokens, Tables& t);
    static void buildSections(std::vector<TWTokenView> const& tokens, Tables& t);
    static std::vector<std::string> splitLines(std::string const& text);
};

#endif // TWINDEXBUILDER_HH
