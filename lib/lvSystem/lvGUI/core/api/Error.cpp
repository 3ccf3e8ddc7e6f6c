#include <lvGUI/core/api/Error.hpp>

namespace lvgui
{
    const char *errorToString(Error error)
    {
        switch (error)
        {
        case Error::Ok:
            return "ok";
        case Error::NotInitialized:
            return "runtime not initialized";
        case Error::AlreadyInitialized:
            return "runtime already initialized";
        case Error::NullPointer:
            return "null pointer";
        case Error::InvalidParameter:
            return "invalid parameter";
        case Error::InvalidHandle:
            return "object no longer exists";
        case Error::OutOfMemory:
            return "out of memory";
        case Error::DisplayError:
            return "display error";
        }
        return "unknown error";
    }
}
