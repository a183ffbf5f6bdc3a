#ifndef ORGCLONE_VERSION_HPP
#define ORGCLONE_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define ORGCLONE_VERSION_MAJOR 0
#define ORGCLONE_VERSION_MINOR 3
#define ORGCLONE_VERSION_PATCH 0

#define ORGCLONE_STRINGIFY_(x) #x
#define ORGCLONE_STRINGIFY(x) ORGCLONE_STRINGIFY_(x)
#define ORGCLONE_VERSION_STR                                                                      \
    ORGCLONE_STRINGIFY(ORGCLONE_VERSION_MAJOR)                                                    \
    "." ORGCLONE_STRINGIFY(ORGCLONE_VERSION_MINOR) "." ORGCLONE_STRINGIFY(ORGCLONE_VERSION_PATCH)

/* Human-friendly version string for the C++ codebase */
constexpr const char* ORGCLONE_VERSION = ORGCLONE_VERSION_STR;

#endif /* ORGCLONE_VERSION_HPP */
