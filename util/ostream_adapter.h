#ifndef SNUFFLE_UTIL_OSTREAM_ADAPTER_H_INCLUDED
#define SNUFFLE_UTIL_OSTREAM_ADAPTER_H_INCLUDED

#include <ostream>
#include <memory>
#include <functional>
#include <string>

namespace snuffle { namespace util {

// std::ostream that hands every completed line (without the trailing
// newline) to out_func. An unterminated last line is delivered on
// destruction.
class ostream_adapter : public std::ostream {
public:
    using output_func_type = std::function<void (const std::string&)>;
    explicit ostream_adapter(const output_func_type& out_func);
    ~ostream_adapter();
private:
    std::unique_ptr<std::streambuf> buffer_;
};

} } // namespace snuffle::util

#endif
