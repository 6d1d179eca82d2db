#include "Errors.h"

namespace port_census {

const char* error_kind_name(ErrorKind k){
    switch(k){
        case ErrorKind::CommandExecution: return "command_execution";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::Connection: return "connection";
        case ErrorKind::Authentication: return "authentication";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::NotImplemented: return "not_implemented";
    }
    return "unknown";
}

}
