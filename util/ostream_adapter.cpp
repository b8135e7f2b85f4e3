#include "ostream_adapter.h"
#include <sstream>

using namespace snuffle::util;

namespace {

class line_buffer : public std::stringbuf {
public:
    explicit line_buffer(const ostream_adapter::output_func_type& out_func) : out_func_(out_func) {
    }

    ~line_buffer() {
        sync();
        if (!pending_.empty()) {
            out_func_(pending_);
        }
    }

    int sync() {
        pending_ += str();
        str("");
        std::string::size_type pos;
        while ((pos = pending_.find('\n')) != std::string::npos) {
            out_func_(pending_.substr(0, pos));
            pending_.erase(0, pos + 1);
        }
        return 0;
    }

private:
    ostream_adapter::output_func_type out_func_;
    std::string                       pending_;
};

} // unnamed namespace

namespace snuffle { namespace util {

ostream_adapter::ostream_adapter(const output_func_type& out_func) : std::ostream(nullptr), buffer_(new line_buffer(out_func))
{
    rdbuf(buffer_.get());
}

ostream_adapter::~ostream_adapter()
{
    flush();
    rdbuf(nullptr);
}

} } // namespace snuffle::util
