#pragma once

// Provides:
//
// * mask_stream
//
//   Stream manipulator that enables or disables writing to a stream based on a flag.
//
// * open_or_throw
//
//   Open an fstream, throwing on error.

#include <filesystem>
#include <fstream>
#include <iostream>

namespace sup {

template <typename charT, typename traitsT = std::char_traits<charT> >
class basic_null_streambuf: public std::basic_streambuf<charT, traitsT> {
private:
    using streambuf_type = std::basic_streambuf<charT, traitsT>;

public:
    using char_type = typename streambuf_type::char_type;
    using int_type = typename streambuf_type::int_type;
    using traits_type = typename streambuf_type::traits_type;

    virtual ~basic_null_streambuf() = default;

protected:
    std::streamsize xsputn(const char_type*, std::streamsize count) override {
        return count;
    }

    int_type overflow(int_type c) override {
        return traits_type::not_eof(c);
    }
};

// Output on ranks other than the root is discarded with
//
//     std::cout << sup::mask_stream(rank==0);
class mask_stream {
public:
    explicit mask_stream(bool mask): mask_(mask) {}

    operator bool() const { return mask_; }

    template <typename charT, typename traitsT>
    friend std::basic_ostream<charT, traitsT>&
    operator<<(std::basic_ostream<charT, traitsT>& O, const mask_stream& F) {
        int xindex = get_xindex();

        auto* saved_streambuf =
            static_cast<std::basic_streambuf<charT, traitsT>*>(O.pword(xindex));

        if (F.mask_ && saved_streambuf) {
            // re-enable by restoring saved streambuf
            O.pword(xindex) = nullptr;
            O.rdbuf(saved_streambuf);
        }
        else if (!F.mask_ && !saved_streambuf) {
            // disable stream but save old streambuf
            O.pword(xindex) = O.rdbuf();
            O.rdbuf(get_null_streambuf<charT, traitsT>());
        }

        return O;
    }

private:
    // key for retrieving saved streambufs
    static int get_xindex() {
        static int xindex = std::ios_base::xalloc();
        return xindex;
    }

    template <typename charT, typename traitsT>
    static std::basic_streambuf<charT, traitsT>* get_null_streambuf() {
        static basic_null_streambuf<charT, traitsT> the_null_streambuf;
        return &the_null_streambuf;
    }

    // true => do not filter
    bool mask_;
};

// Throws std::runtime_error if the file can't be opened, or if exclusive
// is set and the path already exists.
std::fstream open_or_throw(const std::filesystem::path& p, std::ios_base::openmode, bool exclusive);

} // namespace sup
