#ifndef MEOWHNS_DEFINES_HH
#define MEOWHNS_DEFINES_HH

/* One carrier sample, one bitstream byte, one RS symbol */
using byte = unsigned char;

/* Log colours: red for errors, yellow for recoverable damage, green/cyan for progress */
#define CLI_RED "\033[31m"
#define CLI_GREEN "\033[32m"
#define CLI_YELLOW "\033[33m"
#define CLI_CYAN "\033[36m"

#define CLI_RESET "\033[0m"

#endif //MEOWHNS_DEFINES_HH
