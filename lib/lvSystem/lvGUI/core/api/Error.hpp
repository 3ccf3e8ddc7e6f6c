#pragma once

#include <stdint.h>
#include <optional>
#include <utility>

namespace lvgui
{
    enum class Error : uint8_t
    {
        Ok = 0,
        NotInitialized,
        AlreadyInitialized,
        NullPointer,
        InvalidParameter,
        InvalidHandle,
        OutOfMemory,
        DisplayError
    };

    const char *errorToString(Error error);

    // Either a value or the reason there is none. Never holds both.
    template <typename T>
    class Result
    {
    public:
        Result(T value) : _error(Error::Ok), _value(std::move(value)) {}
        Result(Error error) : _error(error == Error::Ok ? Error::NullPointer : error) {}

        bool ok() const { return _error == Error::Ok; }
        explicit operator bool() const { return ok(); }
        Error error() const { return _error; }

        T &value() { return *_value; }
        const T &value() const { return *_value; }

        T *operator->() { return &*_value; }
        const T *operator->() const { return &*_value; }
        T &operator*() { return *_value; }
        const T &operator*() const { return *_value; }

        T take() { return std::move(*_value); }

    private:
        Error _error;
        std::optional<T> _value;
    };
}
