#include <tokwh/TWCollector.hh>

#include <tokwh/TWExc.hh>
#include <tokwh/TWIntC.hh>
#include <tokwh/TWWatchdog.hh>
#include <tokwh/Util.hh>

#include <algorithm>

using namespace tokwh;

JSON
TWCollectorError::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("collector", JSON::makeString(collector));
    j.addDictionaryMember(
        "token",
        token_index ? JSON::makeInt(TWIntC::to_longlong(*token_index)) : JSON::makeNull());
    j.addDictionaryMember("kind", JSON::makeString(kind));
    j.addDictionaryMember("type", JSON::makeString(exception_type));
    j.addDictionaryMember("message", JSON::makeString(message));
    return j;
}

size_t
TWDispatchContext::ignoreDepth(std::string const& type) const
{
    auto base = util::base_type(type);
    auto it = std::lower_bound(ignore_types.begin(), ignore_types.end(), base);
    if (it == ignore_types.end() || *it != base) {
        return 0;
    }
    return ignore_depth.at(static_cast<size_t>(it - ignore_types.begin()));
}

std::vector<TWCollectorError> const&
TWDispatchContext::getErrors() const
{
    return errors;
}

bool
TWDispatchContext::isTruncated(std::string const& name) const
{
    return truncated.contains(name);
}

std::optional<size_t>
TWDispatchContext::getTokenIndex() const
{
    return token_index;
}

std::string const&
TWDispatchContext::getCollectorName() const
{
    return collector;
}

void
TWDispatchContext::checkDeadline() const
{
    if (!deadline) {
        return;
    }
    if (TWWatchdog::signalled() || std::chrono::steady_clock::now() >= *deadline) {
        throw TWExc(
            tokwh_e_collector_timeout,
            "",
            collector,
            token_index ? TWIntC::to_longlong(*token_index) : -1,
            "collector exceeded its time budget");
    }
}

bool
TWDispatchContext::admitItem(size_t items_held)
{
    admit_asked = true;
    if (items_held < item_cap) {
        return true;
    }
    cap_refused = true;
    return false;
}

bool
TWCollector::shouldProcess(TWTokenView const&, TWDispatchContext&, TokenWarehouse&)
{
    return true;
}
