// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_DEBUG_H
#define MU_DEBUG_H

#include <MicroUuid/Platform.h>

#define MU_DL_NONE 0x00     //suppress all output to the console
#define MU_DL_ERROR 0x01    //report failures
#define MU_DL_WARN 0x02     //report observed or assumed inconsistent state
#define MU_DL_INFO 0x03     //inform about internal state changes
#define MU_DL_DEBUG 0x04    //relevant info for debugging
#define MU_DL_VERBOSE 0x05  //all output

#ifndef MU_DBG_LEVEL
#define MU_DBG_LEVEL MU_DL_INFO  //default
#endif

#ifndef MU_DBG_ENDL
#define MU_DBG_ENDL "\n"
#endif

#ifndef MU_DBG_MAXMSGSIZE
#define MU_DBG_MAXMSGSIZE 128
#endif //MU_DBG_MAXMSGSIZE

#ifdef __cplusplus

namespace MicroUuid {
class Debug {
private:
    void (*debugCb)(const char *msg) = nullptr;
    void (*debugCb2)(int lvl, const char *fn, int line, const char *msg) = nullptr;

    char buf [MU_DBG_MAXMSGSIZE] = {'\0'};
    int dbgLevel = MU_DBG_LEVEL;
public:
    Debug() {setup();}

    void setDebugCb(void (*debugCb)(const char *msg));
    void setDebugCb2(void (*debugCb2)(int lvl, const char *fn, int line, const char *msg));

    void setDebugLevel(int dbgLevel);
    int getDebugLevel() const {return dbgLevel;}

    bool setup();

    void operator()(int lvl, const char *fn, int line, const char *format, ...);
};

extern Debug debug;
} //namespace MicroUuid
#endif //__cplusplus

#if MU_DBG_LEVEL >= MU_DL_ERROR
#define MU_DBG_ERR(...) MicroUuid::debug(MU_DL_ERROR, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MU_DBG_ERR(...) (void)0
#endif

#if MU_DBG_LEVEL >= MU_DL_WARN
#define MU_DBG_WARN(...) MicroUuid::debug(MU_DL_WARN, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MU_DBG_WARN(...) (void)0
#endif

#if MU_DBG_LEVEL >= MU_DL_INFO
#define MU_DBG_INFO(...) MicroUuid::debug(MU_DL_INFO, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MU_DBG_INFO(...) (void)0
#endif

#if MU_DBG_LEVEL >= MU_DL_DEBUG
#define MU_DBG_DEBUG(...) MicroUuid::debug(MU_DL_DEBUG, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MU_DBG_DEBUG(...) (void)0
#endif

#if MU_DBG_LEVEL >= MU_DL_VERBOSE
#define MU_DBG_VERBOSE(...) MicroUuid::debug(MU_DL_VERBOSE, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MU_DBG_VERBOSE(...) (void)0
#endif

#endif
