#include <tokwh/TWLogger.hh>

#include <tokwh/Pl_Discard.hh>
#include <tokwh/Pl_OStream.hh>

#include <cstring>
#include <iostream>
#include <stdexcept>

TWLogger::Members::Members() :
    p_discard(new Pl_Discard()),
    p_stdout(new Pl_OStream("standard output", std::cout)),
    p_stderr(new Pl_OStream("standard error", std::cerr)),
    p_info(p_stdout),
    p_warn(nullptr),
    p_error(p_stderr)
{
}

TWLogger::Members::~Members()
{
    p_stdout->finish();
    p_stderr->finish();
}

TWLogger::TWLogger() :
    m(new Members())
{
}

std::shared_ptr<TWLogger>
TWLogger::create()
{
    return std::shared_ptr<TWLogger>(new TWLogger);
}

std::shared_ptr<TWLogger>
TWLogger::defaultLogger()
{
    static auto l = create();
    return l;
}

void
TWLogger::emit(std::shared_ptr<Pipeline> const& p, char const* s, size_t len)
{
    if (!m->prefix.empty()) {
        p->writeString(m->prefix);
    }
    p->write(s, len);
}

void
TWLogger::info(char const* s)
{
    emit(getInfo(false), s, strlen(s));
}

void
TWLogger::info(std::string const& s)
{
    emit(getInfo(false), s.data(), s.size());
}

std::shared_ptr<Pipeline>
TWLogger::getInfo(bool null_okay)
{
    return throwIfNull(m->p_info, null_okay);
}

void
TWLogger::warn(char const* s)
{
    emit(getWarn(false), s, strlen(s));
}

void
TWLogger::warn(std::string const& s)
{
    emit(getWarn(false), s.data(), s.size());
}

std::shared_ptr<Pipeline>
TWLogger::getWarn(bool null_okay)
{
    if (m->p_warn) {
        return m->p_warn;
    }
    return getError(null_okay);
}

void
TWLogger::error(char const* s)
{
    emit(getError(false), s, strlen(s));
}

void
TWLogger::error(std::string const& s)
{
    emit(getError(false), s.data(), s.size());
}

std::shared_ptr<Pipeline>
TWLogger::getError(bool null_okay)
{
    return throwIfNull(m->p_error, null_okay);
}

std::shared_ptr<Pipeline>
TWLogger::standardOutput()
{
    return m->p_stdout;
}

std::shared_ptr<Pipeline>
TWLogger::standardError()
{
    return m->p_stderr;
}

std::shared_ptr<Pipeline>
TWLogger::discard()
{
    return m->p_discard;
}

void
TWLogger::setInfo(std::shared_ptr<Pipeline> p)
{
    m->p_info = p ? p : m->p_stdout;
}

void
TWLogger::setWarn(std::shared_ptr<Pipeline> p)
{
    m->p_warn = p;
}

void
TWLogger::setError(std::shared_ptr<Pipeline> p)
{
    m->p_error = p ? p : m->p_stderr;
}

void
TWLogger::setPrefix(std::string const& prefix)
{
    m->prefix = prefix;
}

std::string const&
TWLogger::getPrefix() const
{
    return m->prefix;
}

void
TWLogger::setOutputStreams(std::ostream* out_stream, std::ostream* err_stream)
{
    if (out_stream == &std::cout) {
        out_stream = nullptr;
    }
    if (err_stream == &std::cerr) {
        err_stream = nullptr;
    }
    m->p_info = out_stream ? std::make_shared<Pl_OStream>("output", *out_stream) : m->p_stdout;
    m->p_warn = nullptr;
    m->p_error =
        err_stream ? std::make_shared<Pl_OStream>("error output", *err_stream) : m->p_stderr;
}

std::shared_ptr<Pipeline>
TWLogger::throwIfNull(std::shared_ptr<Pipeline> p, bool null_okay)
{
    if (!(null_okay || p)) {
        throw std::logic_error("TWLogger: requested a null pipeline without null_okay == true");
    }
    return p;
}
