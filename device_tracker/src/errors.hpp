#ifndef ERRORS_HPP
#define ERRORS_HPP

enum ResultCode {
    RESULT_OK,
    RESULT_NOT_FOUND,       /* document or key absent */
    RESULT_UNRESOLVABLE,    /* MAC address could not be determined */
    RESULT_NONE_REACHABLE,  /* no gateway answered */
    RESULT_IO_ERROR,        /* document could not be written */
};

const char* result_code_str(ResultCode code);

#endif
