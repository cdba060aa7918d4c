#include <tokwh/TWExc.hh>

TWExc::TWExc(
    tokwh_error_code_e error_code,
    std::string const& source,
    std::string const& object,
    long long position,
    std::string const& message) :
    std::runtime_error(createWhat(source, object, position, message)),
    error_code(error_code),
    source(source),
    object(object),
    position(position < 0 ? -1 : position),
    message(message)
{
}

std::string
TWExc::createWhat(
    std::string const& source,
    std::string const& object,
    long long position,
    std::string const& message)
{
    std::string result;
    if (!source.empty()) {
        result += source;
    }
    if (!(object.empty() && position < 0)) {
        if (!source.empty()) {
            result += " (";
        }
        if (!object.empty()) {
            result += object;
            if (position >= 0) {
                result += ", ";
            }
        }
        if (position >= 0) {
            result += "token " + std::to_string(position);
        }
        if (!source.empty()) {
            result += ")";
        }
    }
    if (!result.empty()) {
        result += ": ";
    }
    result += message;
    return result;
}

tokwh_error_code_e
TWExc::getErrorCode() const
{
    return error_code;
}

std::string const&
TWExc::getSource() const
{
    return source;
}

std::string const&
TWExc::getObject() const
{
    return object;
}

long long
TWExc::getPosition() const
{
    return position;
}

std::string const&
TWExc::getMessageDetail() const
{
    return message;
}

TWReentrancyError::TWReentrancyError(std::string const& message) :
    std::logic_error(message)
{
}

TWUsage::TWUsage(std::string const& message) :
    std::runtime_error(message)
{
}
