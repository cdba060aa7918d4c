#include <tokwh/TWTokenView.hh>

#include <tokwh/TWIntC.hh>

#include <utility>

TWTokenView::TWTokenView(
    std::string type,
    int nesting,
    std::string tag,
    std::optional<LineRange> map,
    std::optional<std::string> info,
    std::string content,
    std::optional<std::string> href,
    std::optional<std::string> src,
    std::optional<std::string> title) :
    type_(std::move(type)),
    nesting_(nesting < 0 ? -1 : (nesting > 0 ? 1 : 0)),
    tag_(std::move(tag)),
    info_(std::move(info)),
    content_(std::move(content)),
    href_(std::move(href)),
    src_(std::move(src)),
    title_(std::move(title))
{
    if (map) {
        map_ = clampMap(map->start, map->end);
    }
}

TWTokenView::LineRange
TWTokenView::clampMap(long long start, long long end)
{
    start = TWIntC::clamp(start, 0, MAX_LINE);
    end = TWIntC::clamp(end, 0, MAX_LINE);
    if (end < start) {
        end = start;
    }
    return {start, end};
}

size_t
TWTokenView::byteSize() const
{
    size_t size = type_.size() + tag_.size() + content_.size();
    for (auto const* field: {&info_, &href_, &src_, &title_}) {
        if (*field) {
            size += (*field)->size();
        }
    }
    return size;
}
