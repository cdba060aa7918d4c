#include <tokwh/Constants.h>
#include <tokwh/JSON.hh>
#include <tokwh/Pl_OStream.hh>
#include <tokwh/ReferenceCollectors.hh>
#include <tokwh/TWArgParser.hh>
#include <tokwh/TWConfig.hh>
#include <tokwh/TWExc.hh>
#include <tokwh/TWIsolatedRunner.hh>
#include <tokwh/TWJSONNode.hh>
#include <tokwh/TWLogger.hh>
#include <tokwh/TWURL.hh>
#include <tokwh/TWUtil.hh>
#include <tokwh/TokenWarehouse.hh>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>

static char const* whoami = nullptr;

namespace
{
    struct Options
    {
        std::string infile;
        std::string text_file;
        std::vector<std::string> collectors;
        bool sections{false};
        bool fingerprint{false};
        uint32_t isolate_ms{0};
        std::string check_url;
        bool have_check_url{false};
    };

    class ArgParser
    {
      public:
        ArgParser(int argc, char* argv[], TWConfig& config);
        Options parseArgs();

      private:
        void initOptions();
        void setting(char const* name, std::string const& value);
        void argHelp();
        void argPositional(std::string const&);
        void argCollectors(std::string const&);
        void argMaxItems(std::string const&);
        void argIsolate(std::string const&);
        void argCheckUrl(std::string const&);
        void finalChecks();

        TWArgParser ap;
        TWConfig& config;
        Options o;
    };
} // namespace

static void
usage()
{
    std::cout << "Usage: " << whoami << " [options] tokens.json\n"
              << "       " << whoami << " [options] --check-url=url\n"
              << "\n"
              << "Dispatch the tokens of a markdown-it token dump to the reference collectors\n"
              << "and print their results as JSON. Environment variables TOKWH_* are applied\n"
              << "first; options override them.\n"
              << "\n"
              << "  --text=file              document source, for line text and the size limit\n"
              << "  --collectors=a,b         run only the named collectors\n"
              << "  --max-tokens=n           reject documents with more than n tokens\n"
              << "  --max-bytes=n            reject documents larger than n bytes\n"
              << "  --max-nesting=n          reject documents nested more than n deep\n"
              << "  --max-items=name=n       item cap for one collector; may be repeated\n"
              << "  --allowed-schemes=a,b    URL schemes that are allowed\n"
              << "  --timeout=seconds        time budget for one collector call, 0 for none\n"
              << "  --isolate=ms             run each collector in a child process that is\n"
              << "                           killed after ms milliseconds\n"
              << "  --allow-raw-html         let the html collector return raw HTML\n"
              << "  --strict                 fail on the first collector error\n"
              << "  --sections               print the section table instead of the results\n"
              << "  --fingerprint            print the SHA-256 fingerprint of the results\n"
              << "  --check-url=url          normalize url and print the verdict\n"
              << "  --help                   show this text\n"
              << "\n"
              << "Exit status is " << tokwh_exit_success << " on success, " << tokwh_exit_warning
              << " if warnings were issued or a collector failed, and " << tokwh_exit_error
              << " on error.\n";
}

static void
usageExit(std::string const& msg)
{
    std::cerr << "\n"
              << whoami << ": " << msg << "\n"
              << "\n"
              << "For help:\n"
              << "  " << whoami << " --help\n"
              << "\n";
    exit(tokwh_exit_error);
}

ArgParser::ArgParser(int argc, char* argv[], TWConfig& config) :
    ap(argc, argv),
    config(config)
{
    initOptions();
}

void
ArgParser::initOptions()
{
    auto b = [this](void (ArgParser::*f)()) { return TWArgParser::bindBare(f, this); };
    auto p = [this](void (ArgParser::*f)(std::string const&)) {
        return TWArgParser::bindParam(f, this);
    };
    // Options that map directly onto a configuration setting
    struct
    {
        char const* arg;
        char const* setting;
        char const* parameter_name;
    } const settings[] = {
        {"max-tokens", "TOKWH_MAX_TOKENS", "n"},
        {"max-bytes", "TOKWH_MAX_BYTES", "n"},
        {"max-nesting", "TOKWH_MAX_NESTING", "n"},
        {"allowed-schemes", "TOKWH_ALLOWED_SCHEMES", "scheme,..."},
        {"timeout", "TOKWH_COLLECTOR_TIMEOUT_SECONDS", "seconds"},
    };
    for (auto const& s: settings) {
        auto name = s.setting;
        ap.addRequiredParameter(
            s.arg, [this, name](std::string const& v) { setting(name, v); }, s.parameter_name);
    }

    ap.addHelpOption("help", b(&ArgParser::argHelp));
    ap.addPositional(p(&ArgParser::argPositional));
    ap.addRequiredParameter(
        "text", [this](std::string const& v) { o.text_file = v; }, "file");
    ap.addRequiredParameter("collectors", p(&ArgParser::argCollectors), "name,...");
    ap.addRequiredParameter("max-items", p(&ArgParser::argMaxItems), "name=n");
    ap.addRequiredParameter("isolate", p(&ArgParser::argIsolate), "ms");
    ap.addRequiredParameter("check-url", p(&ArgParser::argCheckUrl), "url");
    ap.addBare("allow-raw-html", [this]() { config.setAllowRawHtml(true); });
    ap.addBare("strict", [this]() { config.setStrict(true); });
    ap.addBare("sections", [this]() { o.sections = true; });
    ap.addBare("fingerprint", [this]() { o.fingerprint = true; });
    ap.addFinalCheck(b(&ArgParser::finalChecks));
}

void
ArgParser::setting(char const* name, std::string const& value)
{
    config.applySetting(name, value);
}

void
ArgParser::argHelp()
{
    usage();
    exit(tokwh_exit_success);
}

void
ArgParser::argPositional(std::string const& arg)
{
    if (!o.infile.empty()) {
        ap.usage("only one token file may be given");
    }
    o.infile = arg;
}

void
ArgParser::argCollectors(std::string const& arg)
{
    o.collectors = TWUtil::split_string(arg, ',', true);
}

void
ArgParser::argMaxItems(std::string const& arg)
{
    if (arg.find('=') == std::string::npos) {
        ap.usage("--max-items requires name=n");
    }
    config.applySetting("TOKWH_MAX_ITEMS_PER_TYPE", arg);
}

void
ArgParser::argIsolate(std::string const& arg)
{
    auto ms = TWUtil::string_to_ull(arg.c_str());
    if (ms == 0 || ms > UINT32_MAX) {
        ap.usage("--isolate requires a positive number of milliseconds");
    }
    o.isolate_ms = static_cast<uint32_t>(ms);
}

void
ArgParser::argCheckUrl(std::string const& arg)
{
    o.check_url = arg;
    o.have_check_url = true;
}

void
ArgParser::finalChecks()
{
    if (!o.have_check_url && o.infile.empty()) {
        ap.usage("no token file given");
    }
    if (o.sections &&
        std::find(o.collectors.begin(), o.collectors.end(), "sections") == o.collectors.end()) {
        o.collectors.emplace_back("sections");
    }
}

Options
ArgParser::parseArgs()
{
    ap.parseArgs();
    return o;
}

static int
check_url(std::string const& url, TWConfig const& config)
{
    auto result = TWURL::tryNormalize(url, config);
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("valid", JSON::makeBool(result.has_value()));
    if (result) {
        j.addDictionaryMember(
            "scheme", result->scheme ? JSON::makeString(*result->scheme) : JSON::makeNull());
        j.addDictionaryMember("normalized", JSON::makeString(result->normalized));
    }
    j.addDictionaryMember("allowed", JSON::makeBool(result && result->allowed));
    std::cout << j.unparse() << "\n";
    return (result && result->allowed) ? tokwh_exit_success : tokwh_exit_warning;
}

static std::vector<std::shared_ptr<TWCollector>>
selected_collectors(Options const& o, TWConfig const& config)
{
    if (o.collectors.empty()) {
        return tokwh::makeReferenceCollectors(config);
    }
    std::vector<std::shared_ptr<TWCollector>> result;
    for (auto const& name: o.collectors) {
        auto c = tokwh::makeReferenceCollector(name, config);
        if (!c) {
            throw TWUsage("unknown collector " + name);
        }
        result.push_back(c);
    }
    return result;
}

static int
run(Options const& o, TWConfig const& config)
{
    auto logger = TWLogger::defaultLogger();
    logger->setPrefix(std::string(whoami) + ": ");

    auto nodes = TWJSONNode::parseDocument(TWUtil::read_file_into_string(o.infile.c_str()));
    std::string text;
    if (!o.text_file.empty()) {
        text = TWUtil::read_file_into_string(o.text_file.c_str());
    }
    TokenWarehouse w(nodes, config, text, logger);
    auto collectors = selected_collectors(o, config);

    std::map<std::string, JSON> results;
    bool failed = false;
    if (o.isolate_ms) {
        // Limits were checked above; each child dispatches the canonical tokens again.
        for (auto const& c: collectors) {
            auto r = TWIsolatedRunner::run(w.getTokens(), c, o.isolate_ms, config, text);
            if (r.status != TWIsolatedResult::st_ok) {
                logger->warn(
                    "collector " + c->getName() + ": " + TWIsolatedResult::statusName(r.status) +
                    ": " + r.message + "\n");
                if (config.getStrict()) {
                    throw TWExc(
                        r.status == TWIsolatedResult::st_timeout ? tokwh_e_collector_timeout
                                                                 : tokwh_e_collector,
                        "",
                        c->getName(),
                        -1,
                        r.message);
                }
                failed = true;
            } else if (r.result.getDictItem("errors").size() > 0) {
                failed = true;
            }
            results[c->getName()] = r.result;
        }
    } else {
        for (auto const& c: collectors) {
            w.registerCollector(c);
        }
        w.dispatchAll();
        results = w.finalizeAll();
        failed = !w.getErrors().empty();
    }

    if (o.fingerprint) {
        std::cout << TokenWarehouse::fingerprint(results) << "\n";
    } else {
        Pl_OStream out("stdout", std::cout);
        if (o.sections) {
            auto it = results.find("sections");
            auto sections = it == results.end() ? JSON::makeNull() : it->second;
            sections.write(&out);
        } else {
            TokenWarehouse::resultsToJSON(results).write(&out);
        }
        out << "\n";
        out.finish();
    }
    return (w.anyWarnings() || failed) ? tokwh_exit_warning : tokwh_exit_success;
}

int
main(int argc, char* argv[])
{
    whoami = TWUtil::getWhoami(argv[0]);

    try {
        auto config = TWConfig::fromEnvironment();
        ArgParser ap(argc, argv, config);
        auto o = ap.parseArgs();
        if (o.have_check_url) {
            return check_url(o.check_url, config);
        }
        return run(o, config);
    } catch (TWUsage& e) {
        usageExit(e.what());
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << "\n";
        return tokwh_exit_error;
    }
    return tokwh_exit_error;
}
