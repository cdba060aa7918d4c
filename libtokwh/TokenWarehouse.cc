#include <tokwh/TokenWarehouse.hh>

#include <tokwh/Pl_SHA256.hh>
#include <tokwh/TWCanonicalizer.hh>
#include <tokwh/TWIndexBuilder.hh>
#include <tokwh/TWIntC.hh>
#include <tokwh/TWUtil.hh>
#include <tokwh/TWWatchdog.hh>
#include <tokwh/Util.hh>
#include <tokwh/global_private.hh>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <typeinfo>

using namespace tokwh;
using namespace std::literals;

namespace
{
    TWExc
    limit_exceeded(std::string const& what, unsigned long long limit)
    {
        global::Limits::error();
        return {
            tokwh_e_resource_limit,
            "",
            what,
            -1,
            "document exceeds limit of " + std::to_string(limit)};
    }
} // namespace

struct TokenWarehouse::CollectorEntry
{
    std::shared_ptr<TWCollector> collector;
    std::string name;
    TWInterest interest;
    size_t cap{0};
    // Set when the cap is reached.
    bool truncated{false};
    // Set when the collector asks for an item beyond the cap; no more tokens are routed to it.
    bool closed{false};
    // Whether the collector has ever called TWDispatchContext::admitItem.
    bool asks_admission{false};
    // Bits of the ignored types when there are at most 64 of them, otherwise their indices.
    uint64_t mask{0};
    std::vector<size_t> ignore_bits;
};

class TokenWarehouse::Members
{
    friend class TokenWarehouse;

  public:
    Members(TWConfig const& config, std::shared_ptr<TWLogger> logger) :
        config(config),
        log(logger ? logger : TWLogger::defaultLogger())
    {
    }
    Members(Members const&) = delete;

  private:
    TWConfig config;
    std::shared_ptr<TWLogger> log;
    state_e state{st_idle};
    bool results_taken{false};
    std::vector<TWTokenView> tokens;
    TWIndexBuilder::Tables tables;
    // Sorted by name once dispatch starts.
    std::vector<CollectorEntry> collectors;
    // token type -> collector positions, in name order
    std::map<std::string, std::vector<size_t>> routing;
    bool use_mask{true};
    TWDispatchContext ctx;
    std::vector<TWExc> warnings;
    size_t num_warnings{0};
};

TokenWarehouse::TokenWarehouse(
    std::vector<std::shared_ptr<TWRawNode>> const& nodes,
    TWConfig const& config,
    std::string const& text,
    std::shared_ptr<TWLogger> logger) :
    m(std::make_unique<Members>(config, logger))
{
    m->tokens = TWCanonicalizer::flatten(
        nodes, config.getMaxTokens(), config.getMaxNesting(), [this](TWExc const& e) {
            warn(e);
        });
    initialize(text);
}

TokenWarehouse::TokenWarehouse(
    std::vector<TWTokenView> tokens,
    TWConfig const& config,
    std::string const& text,
    std::shared_ptr<TWLogger> logger) :
    m(std::make_unique<Members>(config, logger))
{
    m->tokens = std::move(tokens);
    initialize(text);
}

TokenWarehouse::~TokenWarehouse() = default;

void
TokenWarehouse::initialize(std::string const& text)
{
    // Limits are checked before any index is built.
    checkLimits(text);
    m->tables = TWIndexBuilder::build(m->tokens, text);
}

void
TokenWarehouse::checkLimits(std::string const& text)
{
    auto const& config = m->config;
    if (m->tokens.size() > config.getMaxTokens()) {
        throw limit_exceeded("token count", config.getMaxTokens());
    }

    uint64_t fields = 0;
    for (auto const& tok: m->tokens) {
        fields += tok.byteSize();
    }
    uint64_t bytes = std::max<uint64_t>(text.size(), fields);
    if (bytes > config.getMaxBytes()) {
        throw limit_exceeded("document size", config.getMaxBytes());
    }

    // Measured on the same stack the index pass keeps, so unmatched opens count.
    if (TWIndexBuilder::exceedsNesting(m->tokens, config.getMaxNesting())) {
        throw limit_exceeded("nesting depth", config.getMaxNesting());
    }
}

void
TokenWarehouse::registerCollector(std::shared_ptr<TWCollector> collector)
{
    if (!collector) {
        throw std::logic_error("TokenWarehouse::registerCollector called with a null collector");
    }
    if (m->state != st_idle) {
        throw std::logic_error("TokenWarehouse::registerCollector called after dispatchAll");
    }
    CollectorEntry entry;
    entry.name = collector->getName();
    for (auto const& e: m->collectors) {
        if (e.name == entry.name) {
            throw std::logic_error(
                "TokenWarehouse::registerCollector: duplicate collector name " + entry.name);
        }
    }
    entry.interest = collector->getInterest();
    entry.cap = m->config.getMaxItems(entry.name);
    entry.collector = std::move(collector);
    m->collectors.push_back(std::move(entry));
}

void
TokenWarehouse::compileRouting()
{
    auto& collectors = m->collectors;
    std::stable_sort(collectors.begin(), collectors.end(), [](auto const& a, auto const& b) {
        return a.name < b.name;
    });

    // Bits are assigned over the sorted type names so that they never depend on registration
    // order.
    std::set<std::string> types;
    for (auto const& entry: collectors) {
        for (auto const& t: entry.interest.ignore_inside) {
            types.insert(util::base_type(t));
        }
    }
    auto& ctx = m->ctx;
    ctx.ignore_types.assign(types.begin(), types.end());
    ctx.ignore_depth.assign(types.size(), 0);
    m->use_mask = types.size() <= 64;

    for (size_t idx = 0; idx < collectors.size(); ++idx) {
        auto& entry = collectors[idx];
        for (auto const& t: entry.interest.ignore_inside) {
            auto base = util::base_type(t);
            auto bit = static_cast<size_t>(
                std::lower_bound(ctx.ignore_types.begin(), ctx.ignore_types.end(), base) -
                ctx.ignore_types.begin());
            if (m->use_mask) {
                entry.mask |= uint64_t(1) << bit;
            } else {
                entry.ignore_bits.push_back(bit);
            }
        }
        for (auto const& t: entry.interest.types) {
            m->routing[t].push_back(idx);
        }
        if (entry.cap == 0) {
            entry.truncated = true;
            entry.closed = true;
            ctx.truncated.insert(entry.name);
            global::Limits::error();
            warn(TWExc(
                tokwh_e_resource_limit,
                "",
                entry.name,
                -1,
                "item cap is 0; no tokens are dispatched"));
        }
    }
}

template <typename F>
bool
TokenWarehouse::invoke(CollectorEntry& entry, std::optional<size_t> index, F fn)
{
    auto& ctx = m->ctx;
    ctx.collector = entry.name;
    ctx.token_index = index;
    ctx.item_cap = entry.cap;
    ctx.cap_refused = false;
    ctx.admit_asked = false;

    bool failed = false;
    bool timeout = false;
    std::string type;
    std::string message;
    {
        TWWatchdog::Call call(m->config.getCollectorTimeoutMillis());
        ctx.deadline = call.deadline();
        try {
            fn();
        } catch (TWReentrancyError&) {
            ctx.deadline.reset();
            throw;
        } catch (TWExc& e) {
            failed = true;
            timeout = e.getErrorCode() == tokwh_e_collector_timeout;
            type = "TWExc";
            message = e.getMessageDetail();
        } catch (std::exception& e) {
            failed = true;
            type = TWUtil::type_name(typeid(e));
            message = e.what();
        } catch (...) {
            failed = true;
            type = "unknown";
            message = "unknown exception";
        }
        if (!failed && call.expired()) {
            failed = true;
            timeout = true;
            type = "timeout";
            message = "collector exceeded its time budget";
        }
        ctx.deadline.reset();
    }
    if (failed) {
        recordError(entry, index, timeout, type, message);
    }
    return !failed;
}

void
TokenWarehouse::dispatchAll()
{
    if (m->state == st_dispatching) {
        throw TWReentrancyError("TokenWarehouse::dispatchAll called while already dispatching");
    }
    if (m->state == st_finalized) {
        throw TWReentrancyError("TokenWarehouse::dispatchAll may only be called once");
    }
    m->state = st_dispatching;

    // The warehouse is finalized however dispatch ends.
    struct Done
    {
        ~Done()
        {
            m.state = st_finalized;
            m.ctx.token_index.reset();
            m.ctx.collector.clear();
        }
        Members& m;
    } done{*m};

    compileRouting();
    TWWatchdog::Scope watchdog(m->config.getCollectorTimeoutMillis());

    auto& ctx = m->ctx;
    auto& depth = ctx.ignore_depth;
    uint64_t active = 0;
    // (last token of a suppressed subtree, type bit); ranges are nested, so the innermost one is
    // at the back.
    std::vector<std::pair<size_t, size_t>> releases;

    auto release = [&](size_t bit) {
        if (depth[bit] > 0 && --depth[bit] == 0 && m->use_mask) {
            active &= ~(uint64_t(1) << bit);
        }
    };
    auto acquire = [&](size_t bit) {
        if (depth[bit]++ == 0 && m->use_mask) {
            active |= uint64_t(1) << bit;
        }
    };
    auto ignored = [&](CollectorEntry const& entry) {
        if (m->use_mask) {
            return (active & entry.mask) != 0;
        }
        return std::any_of(entry.ignore_bits.begin(), entry.ignore_bits.end(), [&](size_t b) {
            return depth[b] > 0;
        });
    };

    auto const& tokens = m->tokens;
    for (size_t i = 0; i < tokens.size(); ++i) {
        auto const& tok = tokens[i];

        std::optional<size_t> bit;
        if (!ctx.ignore_types.empty()) {
            auto base = util::base_type(tok.type());
            auto it = std::lower_bound(ctx.ignore_types.begin(), ctx.ignore_types.end(), base);
            if (it != ctx.ignore_types.end() && *it == base) {
                bit = static_cast<size_t>(it - ctx.ignore_types.begin());
            }
        }
        bool release_after = false;
        if (bit) {
            if (tok.nesting() == 1) {
                acquire(*bit);
            } else if (tok.nesting() == 0) {
                acquire(*bit);
                releases.emplace_back(i + tok.descendants(), *bit);
            } else {
                // A close token is still inside its region.
                release_after = depth[*bit] > 0;
            }
        }

        auto route = m->routing.find(tok.type());
        if (route != m->routing.end()) {
            for (auto idx: route->second) {
                auto& entry = m->collectors[idx];
                if (entry.closed || ignored(entry)) {
                    continue;
                }
                size_t count = 0;
                bool ok = invoke(entry, i, [&]() {
                    auto& c = *entry.collector;
                    if (c.shouldProcess(tok, ctx, *this)) {
                        c.onToken(i, tok, ctx, *this);
                    }
                    count = c.itemCount();
                });
                if (!entry.truncated && (ctx.cap_refused || (ok && count >= entry.cap))) {
                    entry.truncated = true;
                    ctx.truncated.insert(entry.name);
                    global::Limits::error();
                    warn(TWExc(
                        tokwh_e_resource_limit,
                        "",
                        entry.name,
                        TWIntC::to_longlong(i),
                        "collector reached its item cap of " + std::to_string(entry.cap) +
                            "; further items are dropped"));
                }
                // A collector that asks for admission keeps receiving tokens until it asks to
                // start an item beyond the cap, so the item that reached the cap is still filled
                // in. Other collectors are closed as soon as they reach it.
                entry.asks_admission = entry.asks_admission || ctx.admit_asked;
                if (ctx.cap_refused ||
                    (ok && (count > entry.cap || (count == entry.cap && !entry.asks_admission)))) {
                    entry.closed = true;
                }
            }
        }

        if (release_after) {
            release(*bit);
        }
        while (!releases.empty() && releases.back().first <= i) {
            release(releases.back().second);
            releases.pop_back();
        }
    }
}

void
TokenWarehouse::recordError(
    CollectorEntry& entry,
    std::optional<size_t> index,
    bool timeout,
    std::string const& exception_type,
    std::string const& message)
{
    TWCollectorError error;
    error.collector = entry.name;
    error.token_index = index;
    error.kind = timeout ? "timeout" : "exception";
    error.exception_type = exception_type;
    error.message = message;
    m->ctx.errors.push_back(error);

    TWExc e(
        timeout ? tokwh_e_collector_timeout : tokwh_e_collector,
        "",
        entry.name,
        index ? TWIntC::to_longlong(*index) : -1,
        (timeout ? "timed out: "s : "failed: "s) + exception_type + ": " + message);
    if (m->config.getStrict()) {
        throw e;
    }
    warn(e);
}

std::map<std::string, JSON>
TokenWarehouse::finalizeAll()
{
    if (m->state != st_finalized) {
        throw std::logic_error("TokenWarehouse::finalizeAll called before dispatchAll completed");
    }
    if (m->results_taken) {
        throw std::logic_error("TokenWarehouse::finalizeAll may only be called once");
    }
    m->results_taken = true;

    // Drop every reference to the collectors however this returns.
    struct Release
    {
        ~Release()
        {
            m.collectors.clear();
            m.routing.clear();
            m.ctx.collector.clear();
        }
        Members& m;
    } release{*m};

    std::map<std::string, JSON> results;
    TWWatchdog::Scope watchdog(m->config.getCollectorTimeoutMillis());
    for (auto& entry: m->collectors) {
        JSON result;
        size_t count = 0;
        bool ok = invoke(entry, std::nullopt, [&]() {
            result = entry.collector->finalize(*this);
            count = entry.collector->itemCount();
        });
        if (!ok) {
            result = JSON::makeDictionary();
            result.addDictionaryMember("items", JSON::makeArray());
            count = 0;
        } else if (!result.isDictionary()) {
            auto wrapped = JSON::makeDictionary();
            wrapped.addDictionaryMember("items", result);
            result = wrapped;
        }
        result.addDictionaryMember("count", JSON::makeInt(TWIntC::to_longlong(count)));
        result.addDictionaryMember("truncated", JSON::makeBool(entry.truncated));
        auto errors = result.addDictionaryMember("errors", JSON::makeArray());
        for (auto const& error: m->ctx.errors) {
            if (error.collector == entry.name) {
                errors.addArrayElement(error.getJSON());
            }
        }
        results[entry.name] = result;
    }
    return results;
}

TokenWarehouse::state_e
TokenWarehouse::getState() const
{
    return m->state;
}

std::optional<size_t>
TokenWarehouse::sectionOf(long long line) const
{
    auto const& sections = m->tables.sections;
    if (line < 0 || sections.empty() || line > sections.back().end_line) {
        return std::nullopt;
    }
    auto it = std::upper_bound(
        sections.begin(), sections.end(), line, [](long long l, TWSection const& s) {
            return l < s.start_line;
        });
    if (it == sections.begin()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - sections.begin()) - 1;
}

std::vector<TWSection> const&
TokenWarehouse::getSections() const
{
    return m->tables.sections;
}

std::vector<TWFence> const&
TokenWarehouse::getFences() const
{
    return m->tables.fences;
}

std::vector<TWTokenView> const&
TokenWarehouse::getTokens() const
{
    return m->tokens;
}

std::vector<size_t> const&
TokenWarehouse::byType(std::string const& type) const
{
    static std::vector<size_t> const empty;
    auto it = m->tables.by_type.find(type);
    return it == m->tables.by_type.end() ? empty : it->second;
}

std::optional<size_t>
TokenWarehouse::pairOf(size_t index) const
{
    if (index >= m->tables.pairs.size() || m->tables.pairs[index] == TWIndexBuilder::none) {
        return std::nullopt;
    }
    return m->tables.pairs[index];
}

std::optional<size_t>
TokenWarehouse::parentOf(size_t index) const
{
    if (index >= m->tables.parents.size() ||
        m->tables.parents[index] == TWIndexBuilder::none) {
        return std::nullopt;
    }
    return m->tables.parents[index];
}

std::optional<long long>
TokenWarehouse::lineOf(size_t index) const
{
    if (index >= m->tables.lines.size()) {
        return std::nullopt;
    }
    return m->tables.lines[index];
}

std::string
TokenWarehouse::lineText(long long line) const
{
    auto const& lines = m->tables.text_lines;
    if (line < 0 || static_cast<unsigned long long>(line) >= lines.size()) {
        return "";
    }
    return lines[static_cast<size_t>(line)];
}

long long
TokenWarehouse::lineCount() const
{
    return m->tables.line_count;
}

TWConfig const&
TokenWarehouse::getConfig() const
{
    return m->config;
}

std::shared_ptr<TWLogger>
TokenWarehouse::getLogger() const
{
    return m->log;
}

std::vector<TWCollectorError> const&
TokenWarehouse::getErrors() const
{
    return m->ctx.errors;
}

void
TokenWarehouse::warn(TWExc const& e)
{
    ++m->num_warnings;
    auto max = m->config.getMaxWarnings();
    if (max == 0 || m->warnings.size() < max) {
        m->warnings.push_back(e);
        m->log->warn("WARNING: "s + e.what() + "\n");
    } else if (m->num_warnings == max + 1) {
        m->log->warn(
            "WARNING: too many warnings; further warnings will be counted but not shown\n");
    }
}

std::vector<TWExc> const&
TokenWarehouse::getWarnings() const
{
    return m->warnings;
}

bool
TokenWarehouse::anyWarnings() const
{
    return m->num_warnings > 0;
}

size_t
TokenWarehouse::numWarnings() const
{
    return m->num_warnings;
}

JSON
TokenWarehouse::resultsToJSON(std::map<std::string, JSON> const& results)
{
    auto j = JSON::makeDictionary();
    for (auto const& [name, result]: results) {
        j.addDictionaryMember(name, result);
    }
    return j;
}

std::string
TokenWarehouse::fingerprint(std::map<std::string, JSON> const& results)
{
    Pl_SHA256 sha;
    resultsToJSON(results).write(&sha);
    sha.finish();
    return sha.getHexDigest();
}
