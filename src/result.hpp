#ifndef ALIGN_DIST_RESULT_H
#define ALIGN_DIST_RESULT_H

#include <boost/variant.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace align_dist {

/// The only failure produced by the core: the input breaks its data contract.
struct MalformedInput {
    std::string reason;
};

inline MalformedInput malformed(const std::string& reason)
{
    return MalformedInput { reason };
}

/// Either a value or a MalformedInput
template<typename T>
class Result
{
public:
    Result(const T& value) : value_(value) {}
    Result(T&& value) : value_(std::move(value)) {}
    Result(const MalformedInput& error) : value_(error) {}

    bool ok() const { return boost::get<T>(&value_) != nullptr; }
    explicit operator bool() const { return ok(); }

    const T& value() const
    {
        const T* v = boost::get<T>(&value_);
        if(v == nullptr)
            throw std::logic_error("no value: " + error().reason);
        return *v;
    }
    T& value()
    {
        T* v = boost::get<T>(&value_);
        if(v == nullptr)
            throw std::logic_error("no value: " + error().reason);
        return *v;
    }

    const MalformedInput& error() const
    {
        const MalformedInput* e = boost::get<MalformedInput>(&value_);
        if(e == nullptr)
            throw std::logic_error("Result holds a value, not an error");
        return *e;
    }

private:
    boost::variant<T, MalformedInput> value_;
};

}

#endif
