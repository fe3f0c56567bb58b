// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>
#include <stdarg.h>
#include <stdio.h>

#include <MicroUuid/Debug.h>

namespace MicroUuid {
const char *dbgLevelLabel [] = {
    "",         //MU_DL_NONE 0x00
    "ERROR",    //MU_DL_ERROR 0x01
    "warning",  //MU_DL_WARN 0x02
    "info",     //MU_DL_INFO 0x03
    "debug",    //MU_DL_DEBUG 0x04
    "verbose"   //MU_DL_VERBOSE 0x05
};

Debug debug;
} //namespace MicroUuid

using namespace MicroUuid;

void Debug::setDebugCb(void (*debugCb)(const char *msg)) {
    this->debugCb = debugCb;
}

void Debug::setDebugCb2(void (*debugCb2)(int lvl, const char *fn, int line, const char *msg)) {
    this->debugCb2 = debugCb2;
}

void Debug::setDebugLevel(int dbgLevel) {
    if (dbgLevel > MU_DBG_LEVEL) {
        MU_DBG_ERR("Debug level limited to %s by build config", dbgLevelLabel[MU_DBG_LEVEL]);
        dbgLevel = MU_DBG_LEVEL;
    }
    if (dbgLevel < MU_DL_NONE) {
        dbgLevel = MU_DL_NONE;
    }
    this->dbgLevel = dbgLevel;
}

bool Debug::setup() {
    if (!debugCb && !debugCb2) {
        // default-initialize console
        debugCb = getDefaultDebugCb(); //defaultDebugCb is null on unsupported platforms. Just inconvenient, not a failure
    }
    return true;
}

void Debug::operator()(int lvl, const char *fn, int line, const char *format, ...) {
    if (lvl > dbgLevel) {
        return;
    }

    if (debugCb2) {
        va_list args;
        va_start(args, format);
        auto ret = vsnprintf(buf, sizeof(buf), format, args);
        if (ret < 0 || (size_t)ret >= sizeof(buf)) {
            snprintf(buf + sizeof(buf) - sizeof(" [...]"), sizeof(" [...]"), " [...]");
        }
        va_end(args);

        debugCb2(lvl, fn, line, buf);
    } else if (debugCb) {
        size_t l = strlen(fn);
        while (l > 0 && fn[l-1] != '/' && fn[l-1] != '\\') {
            l--;
        }

        auto ret = snprintf(buf, sizeof(buf), "[MU] %s (%s:%i): ", dbgLevelLabel[lvl], fn + l, line);
        if (ret < 0 || (size_t)ret >= sizeof(buf)) {
            snprintf(buf + sizeof(buf) - sizeof(" : "), sizeof(" : "), " : ");
        }

        debugCb(buf);

        va_list args;
        va_start(args, format);
        ret = vsnprintf(buf, sizeof(buf), format, args);
        if (ret < 0 || (size_t)ret >= sizeof(buf)) {
            snprintf(buf + sizeof(buf) - sizeof(" [...]"), sizeof(" [...]"), " [...]");
        }
        va_end(args);

        debugCb(buf);
        debugCb(MU_DBG_ENDL);
    }
}
