#include "ostream_adapter.h"
#include <exception>
#include <iostream>
#include <sstream>

using namespace toyrsa::util;

namespace {

class line_buffer : public std::stringbuf {
public:
    // ate keeps the put position after the partial line left behind by str()
    explicit line_buffer(const ostream_adapter::output_func_type& out_func)
        : std::stringbuf(std::ios_base::out | std::ios_base::ate)
        , out_func_(out_func) {
    }

    ~line_buffer() {
        // Destructors are noexcept, an output function failing here can only be reported
        try {
            flush_lines();
            if (!str().empty()) {
                out_func_(str());
            }
        } catch (const std::exception& e) {
            std::cerr << "ostream_adapter: output lost on destruction: " << e.what() << std::endl;
        }
    }

    int sync() {
        flush_lines();
        return 0;
    }

private:
    ostream_adapter::output_func_type out_func_;

    void flush_lines() {
        std::string pending = str();
        size_t start = 0;
        for (size_t nl; (nl = pending.find('\n', start)) != std::string::npos; start = nl + 1) {
            out_func_(pending.substr(start, nl + 1 - start));
        }
        if (start) {
            str(pending.substr(start));
        }
    }
};

} // unnamed namespace

namespace toyrsa { namespace util {

ostream_adapter::ostream_adapter(const output_func_type& out_func) : std::ostream(nullptr), buffer_(new line_buffer(out_func))
{
    rdbuf(buffer_.get());
}

ostream_adapter::~ostream_adapter()
{
    rdbuf(nullptr);
}

ostream_adapter::output_func_type prefixed_output(std::ostream& out, const std::string& name)
{
    std::ostream* os = &out;
    return [os, name](const std::string& line) { (*os) << name << ": " << line << std::flush; };
}

} } // namespace toyrsa::util
