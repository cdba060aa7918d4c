#include <tokwh/assert_test.h>

#include <tokwh/TWArgParser.hh>
#include <tokwh/TWExc.hh>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    class ArgParser
    {
      public:
        // args ends with a null pointer like argv.
        ArgParser(std::vector<char const*> args);
        void parseArgs();

        std::vector<std::string> output;
        bool final_checked{false};

      private:
        void handlePotato();
        void handleSalad(std::string const& p);
        void handlePositional(std::string const& p);
        void finalChecks();

        void initOptions();

        std::vector<char const*> args;
        TWArgParser ap;
    };
} // namespace

ArgParser::ArgParser(std::vector<char const*> args_in) :
    args(std::move(args_in)),
    ap(static_cast<int>(args.size()) - 1, args.data())
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

    ap.addBare("potato", b(&ArgParser::handlePotato));
    ap.addRequiredParameter("salad", p(&ArgParser::handleSalad), "tossed");
    ap.addPositional(p(&ArgParser::handlePositional));
    ap.addHelpOption("version", [this]() { output.emplace_back("3.14159"); });
    ap.addFinalCheck(b(&ArgParser::finalChecks));
}

void
ArgParser::handlePotato()
{
    output.emplace_back("potato");
}

void
ArgParser::handleSalad(std::string const& p)
{
    output.push_back("salad=" + p);
}

void
ArgParser::handlePositional(std::string const& p)
{
    output.push_back("positional " + p + ", " + std::to_string(ap.argsLeft()) + " left");
}

void
ArgParser::finalChecks()
{
    final_checked = true;
}

void
ArgParser::parseArgs()
{
    ap.parseArgs();
}

static std::string
usage_message(std::vector<char const*> args)
{
    ArgParser ap(std::move(args));
    try {
        ap.parseArgs();
    } catch (TWUsage& e) {
        assert(!ap.final_checked);
        return e.what();
    }
    assert(false);
    return "";
}

static void
test_handlers()
{
    ArgParser ap({"prog", "--potato", "-salad=green", "file", "--salad=", "-", nullptr});
    ap.parseArgs();
    std::vector<std::string> expected{
        "potato", "salad=green", "positional file, 2 left", "salad=", "positional -, 0 left"};
    assert(ap.output == expected);
    assert(ap.final_checked);
}

static void
test_errors()
{
    assert(
        usage_message({"prog", "--salad", nullptr}) == "--salad must be given as --salad=tossed");
    assert(
        usage_message({"prog", "--potato=mashed", nullptr}) ==
        "--potato does not take a parameter, but \"mashed\" was given");
    assert(usage_message({"prog", "--nope", nullptr}) == "unrecognized argument --nope");
    assert(usage_message({"prog", "--=x", nullptr}) == "unrecognized argument --=x");
    assert(usage_message({"prog", "---potato", nullptr}) == "unrecognized argument ---potato");
    // Help options stand alone.
    assert(
        usage_message({"prog", "--potato", "--version", nullptr}) ==
        "unrecognized argument --version");

    ArgParser help({"prog", "--version", nullptr});
    help.parseArgs();
    assert(help.output == std::vector<std::string>{"3.14159"});

    char const* argv[] = {"prog", nullptr};
    TWArgParser ap(1, argv);
    ap.addBare("potato", []() {});
    try {
        ap.addBare("potato", []() {});
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "expected: " << e.what() << std::endl;
    }
}

int
main()
{
    test_handlers();
    test_errors();
    std::cout << "arg parser tests done" << std::endl;
    return 0;
}
