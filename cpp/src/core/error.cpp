// ==============================================================================
// error.cpp - MOD-0001: Модель ошибок
// ==============================================================================

#include "crawlsink/error.hpp"

namespace crawlsink {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidField:
        return "invalid field";
    case ErrorKind::ConfigValidation:
        return "config validation";
    case ErrorKind::Format:
        return "format";
    case ErrorKind::Sink:
        return "sink";
    case ErrorKind::ClosedSink:
        return "closed sink";
    case ErrorKind::Archive:
        return "archive";
    case ErrorKind::Config:
        return "config";
    }
    return "unknown";
}

Error Error::wrap(std::string_view context) const {
    return wrap(context, kind);
}

Error Error::wrap(std::string_view context, ErrorKind as) const {
    Error wrapped;
    wrapped.kind = as;
    wrapped.subject = subject;
    wrapped.message.reserve(context.size() + 2 + message.size());
    wrapped.message.append(context);
    wrapped.message.append(": ");
    wrapped.message.append(message);
    return wrapped;
}

Error make_error(ErrorKind kind, std::string message, std::string subject) {
    Error e;
    e.kind = kind;
    e.message = std::move(message);
    e.subject = std::move(subject);
    return e;
}

}  // namespace crawlsink
