#include <tokwh/TWIndexBuilder.hh>

#include <tokwh/TWIntC.hh>
#include <tokwh/TWUtil.hh>
#include <tokwh/Util.hh>

#include <algorithm>

using namespace tokwh;

namespace
{
    struct Frame
    {
        size_t index;
        // Child container frames end after their last descendant; pair frames end at their
        // close token.
        bool container;
        size_t end;
        std::string base;
    };

    // Open/close matching over a flattened token list. A close pairs with the innermost open of
    // the same base type within the innermost child container; opens left above it on the stack
    // are abandoned. Every open and container frame is pushed and popped once, and a close looks
    // at a single candidate, so a pass is linear in the number of tokens.
    class Nesting
    {
      public:
        // Leave the child containers that ended before token i. Returns the innermost enclosing
        // open token or container.
        size_t
        enter(size_t i)
        {
            while (!containers.empty() && stack.at(containers.back()).end < i) {
                popTo(containers.back());
                containers.pop_back();
            }
            return stack.empty() ? TWIndexBuilder::none : stack.back().index;
        }

        // Apply the token's own nesting. Returns the matching open of a close, or none.
        size_t
        apply(size_t i, TWTokenView const& tok)
        {
            if (tok.nesting() == 1) {
                auto base = util::base_type(tok.type());
                opens[base].push_back(stack.size());
                stack.push_back({i, false, 0, std::move(base)});
                return TWIndexBuilder::none;
            }
            if (tok.nesting() != -1) {
                return TWIndexBuilder::none;
            }
            auto it = opens.find(util::base_type(tok.type()));
            if (it == opens.end() || it->second.empty()) {
                return TWIndexBuilder::none;
            }
            auto pos = it->second.back();
            size_t floor = containers.empty() ? 0 : containers.back() + 1;
            if (pos < floor) {
                return TWIndexBuilder::none;
            }
            auto open = stack.at(pos).index;
            popTo(pos);
            return open;
        }

        // Start the token's child container, if it has children.
        void
        descend(size_t i, TWTokenView const& tok)
        {
            if (tok.descendants() > 0) {
                containers.push_back(stack.size());
                stack.push_back({i, true, i + tok.descendants(), ""});
            }
        }

        size_t
        depth() const
        {
            return stack.size();
        }

      private:
        void
        popTo(size_t size)
        {
            while (stack.size() > size) {
                if (!stack.back().container) {
                    opens[stack.back().base].pop_back();
                }
                stack.pop_back();
            }
        }

        std::vector<Frame> stack;
        // Stack positions of container frames
        std::vector<size_t> containers;
        // Stack positions of open frames per base type, innermost last
        std::map<std::string, std::vector<size_t>> opens;
    };
} // namespace

TWIndexBuilder::Tables
TWIndexBuilder::build(std::vector<TWTokenView> const& tokens, std::string const& text)
{
    Tables t;
    t.text_lines = splitLines(text);
    t.line_count = TWIntC::to_longlong(t.text_lines.size());
    buildStructure(tokens, t);
    buildSections(tokens, t);
    return t;
}

std::vector<std::string>
TWIndexBuilder::splitLines(std::string const& text)
{
    std::vector<std::string> lines;
    if (text.empty()) {
        return lines;
    }
    size_t pos = 0;
    while (pos < text.size()) {
        auto nl = text.find('\n', pos);
        auto end = nl == std::string::npos ? text.size() : nl;
        auto line = text.substr(pos, end - pos);
        if (line.ends_with("\r")) {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        if (nl == std::string::npos) {
            break;
        }
        pos = nl + 1;
    }
    return lines;
}

bool
TWIndexBuilder::exceedsNesting(std::vector<TWTokenView> const& tokens, size_t max_nesting)
{
    Nesting nesting;
    for (size_t i = 0; i < tokens.size(); ++i) {
        nesting.enter(i);
        nesting.apply(i, tokens[i]);
        if (nesting.depth() > max_nesting) {
            return true;
        }
        nesting.descend(i, tokens[i]);
    }
    return false;
}

void
TWIndexBuilder::buildStructure(std::vector<TWTokenView> const& tokens, Tables& t)
{
    auto n = tokens.size();
    t.pairs.assign(n, none);
    t.parents.assign(n, none);
    t.lines.assign(n, std::nullopt);

    Nesting nesting;
    for (size_t i = 0; i < n; ++i) {
        auto const& tok = tokens[i];
        t.by_type[tok.type()].push_back(i);

        if (tok.map()) {
            if (tok.map()->end > t.line_count) {
                t.line_count = tok.map()->end;
            }
        }

        t.parents[i] = nesting.enter(i);
        auto open = nesting.apply(i, tok);
        if (open != none) {
            t.pairs[open] = i;
            t.pairs[i] = open;
            t.parents[i] = t.parents[open];
        }
        nesting.descend(i, tok);

        if (tok.map()) {
            t.lines[i] = tok.map()->start;
        } else if (t.pairs[i] != none && t.pairs[i] < i) {
            t.lines[i] = t.lines[t.pairs[i]];
        } else if (t.parents[i] != none) {
            t.lines[i] = t.lines[t.parents[i]];
        }

        if (tok.type() == "fence") {
            TWFence fence;
            fence.token_index = i;
            if (tok.map()) {
                fence.start_line = tok.map()->start;
                fence.end_line = tok.map()->end;
            } else if (t.lines[i]) {
                fence.start_line = fence.end_line = *t.lines[i];
            }
            fence.info = tok.info().value_or("");
            auto words = TWUtil::split_string(TWUtil::trim(fence.info), ' ', true);
            fence.lang = words.empty() ? "" : words.front();
            t.fences.push_back(std::move(fence));
        }
    }
}

void
TWIndexBuilder::buildSections(std::vector<TWTokenView> const& tokens, Tables& t)
{
    std::vector<TWSection> headings;
    for (size_t i = 0; i < tokens.size(); ++i) {
        auto const& tok = tokens[i];
        if (tok.type() != "heading_open" || !tok.map()) {
            continue;
        }
        TWSection s;
        s.heading_index = i;
        s.start_line = tok.map()->start;
        s.level = util::heading_level(tok.tag());
        if (i + 1 < tokens.size() && tokens[i + 1].type() == "inline") {
            s.title = tokens[i + 1].content();
        }
        headings.push_back(std::move(s));
    }
    std::stable_sort(headings.begin(), headings.end(), [](auto const& a, auto const& b) {
        return a.start_line < b.start_line;
    });

    auto& sections = t.sections;
    if (headings.empty() || headings.front().start_line > 0) {
        TWSection preamble;
        preamble.start_line = 0;
        sections.push_back(preamble);
    }
    for (auto& h: headings) {
        if (!sections.empty() && sections.back().heading_index &&
            sections.back().start_line == h.start_line) {
            continue;
        }
        sections.push_back(std::move(h));
    }
    for (size_t i = 0; i + 1 < sections.size(); ++i) {
        sections[i].end_line = sections[i + 1].start_line - 1;
    }
    auto& last = sections.back();
    last.end_line = std::max(last.start_line, t.line_count - 1);
}
