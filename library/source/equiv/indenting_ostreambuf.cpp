#include "indenting_ostreambuf.hpp"

namespace equiv::detail {

indenting_ostreambuf::indenting_ostreambuf(std::ostream& owner, int width,
                                           bool at_line_start):
    owner_{&owner},
    target_{owner.rdbuf()},
    indent_(static_cast<std::string::size_type>(width), ' '),
    at_line_start_{at_line_start}
{
    owner_->rdbuf(this);
}

indenting_ostreambuf::~indenting_ostreambuf()
{
    owner_->rdbuf(target_);
}

auto indenting_ostreambuf::overflow(int ch) -> int
{
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return target_->pubsync() == 0? traits_type::not_eof(ch): ch;
    }
    if (at_line_start_ && (ch != '\n')) {
        const auto count = static_cast<std::streamsize>(size(indent_));
        if (target_->sputn(data(indent_), count) != count) {
            return traits_type::eof();
        }
    }
    at_line_start_ = (ch == '\n');
    return target_->sputc(traits_type::to_char_type(ch));
}

}
