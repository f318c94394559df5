#ifndef _AVCPARSE_BASE_DEFINES_H_
#define _AVCPARSE_BASE_DEFINES_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#ifndef AVCPARSE_CPP_EXPORT
#define AVCPARSE_CPP_EXPORT
#endif

#define DISALLOW_COPY_AND_ASSIGN(TypeName)  \
    TypeName(const TypeName&) = delete;     \
    TypeName& operator=(const TypeName&) = delete

using BinaryBuffer = std::vector<uint8_t>;

namespace avcparse {
namespace utils {

// overloaded helper, used with std::visit
template <class... Ts> struct AVCPARSE_CPP_EXPORT overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace utils
} // namespace avcparse

#endif
