#ifndef indenting_ostreambuf_hpp
#define indenting_ostreambuf_hpp

#include <ostream>
#include <streambuf>
#include <string>

namespace equiv::detail {

/// @brief Output stream buffer prefixing every line with an indent.
/// @note While alive, it takes the place of the buffer of the stream it's
///   made for.
struct indenting_ostreambuf: std::streambuf
{
    static constexpr auto default_width = 2;

    explicit indenting_ostreambuf(std::ostream& owner,
                                  int width = default_width,
                                  bool at_line_start = true);
    ~indenting_ostreambuf() override;

    indenting_ostreambuf(const indenting_ostreambuf&) = delete;
    auto operator=(const indenting_ostreambuf&)
        -> indenting_ostreambuf& = delete;

private:
    auto overflow(int ch) -> int override;

    std::ostream* owner_{};
    std::streambuf* target_{};
    std::string indent_;
    bool at_line_start_{true};
};

}

#endif /* indenting_ostreambuf_hpp */
