#include "download_error.hpp"

const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::LocalIo:
        return "local i/o";
    case ErrorKind::HttpStatus:
        return "http status";
    case ErrorKind::Protocol:
        return "protocol";
    case ErrorKind::Request:
        return "request";
    case ErrorKind::RetriesExhausted:
        return "retries exhausted";
    }
    return "unknown";
}
