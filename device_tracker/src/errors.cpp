#include "errors.hpp"

const char* result_code_str(ResultCode code)
{
    switch (code) {
    case RESULT_OK:
        return "ok";
    case RESULT_NOT_FOUND:
        return "not found";
    case RESULT_UNRESOLVABLE:
        return "unresolvable";
    case RESULT_NONE_REACHABLE:
        return "none reachable";
    case RESULT_IO_ERROR:
        return "i/o error";
    }

    return "unknown";
}
