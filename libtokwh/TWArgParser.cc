#include <tokwh/TWArgParser.hh>

#include <tokwh/TWExc.hh>

#include <cstring>
#include <stdexcept>

TWArgParser::Members::Members(int argc, char const* const argv[]) :
    argc(argc),
    argv(argv)
{
}

TWArgParser::TWArgParser(int argc, char const* const argv[]) :
    m(new Members(argc, argv))
{
}

TWArgParser::OptionEntry&
TWArgParser::registerArg(option_table_t& table, std::string const& arg)
{
    if (table.count(arg)) {
        throw std::logic_error("TWArgParser: adding a duplicate handler for option " + arg);
    }
    return table[arg];
}

void
TWArgParser::addPositional(param_arg_handler_t handler)
{
    registerArg(m->main_option_table, "").param_arg_handler = handler;
}

void
TWArgParser::addBare(std::string const& arg, bare_arg_handler_t handler)
{
    registerArg(m->main_option_table, arg).bare_arg_handler = handler;
}

void
TWArgParser::addRequiredParameter(
    std::string const& arg, param_arg_handler_t handler, char const* parameter_name)
{
    OptionEntry& oe = registerArg(m->main_option_table, arg);
    oe.parameter_needed = true;
    oe.parameter_name = parameter_name;
    oe.param_arg_handler = handler;
}

void
TWArgParser::addHelpOption(std::string const& arg, bare_arg_handler_t handler)
{
    registerArg(m->help_option_table, arg).bare_arg_handler = handler;
}

void
TWArgParser::addFinalCheck(bare_arg_handler_t handler)
{
    m->final_check_handler = handler;
}

int
TWArgParser::argsLeft() const
{
    return m->argc - m->cur_arg - 1;
}

void
TWArgParser::usage(std::string const& message)
{
    throw TWUsage(message);
}

void
TWArgParser::parseArgs()
{
    for (m->cur_arg = 1; m->cur_arg < m->argc; ++m->cur_arg) {
        char const* arg = m->argv[m->cur_arg];
        std::string o_arg(arg);
        std::string arg_s;
        std::string parameter;
        bool have_parameter = false;
        option_table_t* table = &m->main_option_table;
        auto oep = table->end();
        if ((arg[0] == '-') && (strcmp(arg, "-") != 0)) {
            ++arg;
            if (arg[0] == '-') {
                ++arg;
            }
            // Search for = after the first character so --=x is not taken as an empty option.
            arg_s = arg;
            auto equal_pos = arg_s.empty() ? std::string::npos : arg_s.find('=', 1);
            if (equal_pos != std::string::npos) {
                have_parameter = true;
                parameter = arg_s.substr(equal_pos + 1);
                arg_s = arg_s.substr(0, equal_pos);
            }
            if (m->argc == 2 && m->help_option_table.count(arg_s)) {
                table = &m->help_option_table;
            }
            if (!(arg_s.empty() || arg_s.at(0) == '-')) {
                oep = table->find(arg_s);
            }
        } else {
            // The empty string maps to the positional handler.
            oep = table->find("");
            parameter = arg;
        }

        if (oep == table->end()) {
            usage("unrecognized argument " + o_arg);
        }
        OptionEntry& oe = oep->second;
        if (oe.parameter_needed && !have_parameter) {
            usage("--" + arg_s + " must be given as --" + arg_s + "=" + oe.parameter_name);
        }
        if (oe.bare_arg_handler) {
            if (have_parameter) {
                usage(
                    "--" + arg_s + " does not take a parameter, but \"" + parameter +
                    "\" was given");
            }
            oe.bare_arg_handler();
        } else if (oe.param_arg_handler) {
            oe.param_arg_handler(parameter);
        }
    }
    if (m->final_check_handler) {
        m->final_check_handler();
    }
}
