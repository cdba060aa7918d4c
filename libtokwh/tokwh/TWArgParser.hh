#ifndef TWARGPARSER_HH
#define TWARGPARSER_HH

#include <tokwh/DLL.h>

#include <functional>
#include <map>
#include <memory>
#include <string>

// Table-driven parser for the tokwh command line. Options are registered with a handler and are
// given as --name or --name=value; a single leading dash is accepted too. Arguments that do not
// start with a dash go to the positional handler. Errors are thrown as TWUsage.
class TWArgParser
{
  public:
    typedef std::function<void()> bare_arg_handler_t;
    typedef std::function<void(std::string const&)> param_arg_handler_t;

    TOKWH_DLL
    TWArgParser(int argc, char const* const argv[]);

    // Calls the handler of every argument in order and then the final check. A help option is
    // only recognized as the sole argument.
    TOKWH_DLL
    void parseArgs();

    // Handlers for the main option table. Registering the same option twice throws
    // std::logic_error.
    TOKWH_DLL
    void addPositional(param_arg_handler_t);
    TOKWH_DLL
    void addBare(std::string const& arg, bare_arg_handler_t);
    // parameter_name is shown in the error for a missing value: --arg must be given as
    // --arg=parameter_name.
    TOKWH_DLL
    void
    addRequiredParameter(std::string const& arg, param_arg_handler_t, char const* parameter_name);
    // Options that are only valid as the sole argument, such as --help.
    TOKWH_DLL
    void addHelpOption(std::string const& arg, bare_arg_handler_t);
    TOKWH_DLL
    void addFinalCheck(bare_arg_handler_t);

    // Number of arguments after the one whose handler is running.
    TOKWH_DLL
    int argsLeft() const;

    // Throws TWUsage.
    TOKWH_DLL
    void usage(std::string const& message);

    template <class T>
    static bare_arg_handler_t
    bindBare(void (T::*f)(), T* o)
    {
        return std::bind(std::mem_fn(f), o);
    }
    template <class T>
    static param_arg_handler_t
    bindParam(void (T::*f)(std::string const&), T* o)
    {
        return std::bind(std::mem_fn(f), o, std::placeholders::_1);
    }

  private:
    struct OptionEntry
    {
        bool parameter_needed{false};
        std::string parameter_name;
        bare_arg_handler_t bare_arg_handler;
        param_arg_handler_t param_arg_handler;
    };
    typedef std::map<std::string, OptionEntry> option_table_t;

    OptionEntry& registerArg(option_table_t& table, std::string const& arg);

    class Members
    {
        friend class TWArgParser;

      public:
        ~Members() = default;

      private:
        Members(int argc, char const* const argv[]);
        Members(Members const&) = delete;

        int argc;
        char const* const* argv;
        int cur_arg{0};
        option_table_t main_option_table;
        option_table_t help_option_table;
        bare_arg_handler_t final_check_handler;
    };
    std::shared_ptr<Members> m;
};

#endif // TWARGPARSER_HH
