#pragma once

#include <string_view>

namespace JsonRead {

enum class RefKind {
    borrowed,   // points into the source's own buffer
    copied      // points into the caller's scratch buffer
};

/// Decoded string content: a read-only view tagged with where it lives.
/// Valid until the next mutating call on the source or on the scratch buffer.
template<class View>
class Reference {
    RefKind m_kind = RefKind::copied;
    View    m_view{};

    constexpr Reference(RefKind kind, View view): m_kind(kind), m_view(view) {}
public:
    using view_type = View;

    constexpr Reference() = default;

    static constexpr Reference borrowed(View view) {
        return Reference(RefKind::borrowed, view);
    }
    static constexpr Reference copied(View view) {
        return Reference(RefKind::copied, view);
    }

    constexpr RefKind kind() const { return m_kind; }
    constexpr bool is_borrowed() const { return m_kind == RefKind::borrowed; }
    constexpr bool is_copied() const { return m_kind == RefKind::copied; }

    constexpr View get() const { return m_view; }
    constexpr View operator*() const { return m_view; }
    constexpr const View * operator->() const { return &m_view; }
    constexpr operator View() const { return m_view; }
};

/// Validated UTF-8 text
using StrRef   = Reference<std::string_view>;
/// Unescaped bytes, not validated as UTF-8
using BytesRef = Reference<std::string_view>;

} // namespace JsonRead
