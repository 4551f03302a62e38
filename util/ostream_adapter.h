#ifndef TOYRSA_UTIL_OSTREAM_ADAPTER_H_INCLUDED
#define TOYRSA_UTIL_OSTREAM_ADAPTER_H_INCLUDED

#include <ostream>
#include <memory>
#include <functional>
#include <string>

namespace toyrsa { namespace util {

// std::ostream that hands each completed line (including the trailing '\n') to out_func.
// An unterminated last line is delivered when the adapter is destroyed; if out_func
// throws at that point the exception is reported on std::cerr instead of propagating.
class ostream_adapter : public std::ostream {
public:
    using output_func_type = std::function<void (const std::string&)>;
    explicit ostream_adapter(const output_func_type& out_func);
    ~ostream_adapter();
private:
    std::unique_ptr<std::streambuf> buffer_;
};

// Output function writing every line to out as "<name>: <line>"
ostream_adapter::output_func_type prefixed_output(std::ostream& out, const std::string& name);

} } // namespace toyrsa::util

#endif
