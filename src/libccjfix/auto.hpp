#pragma once

// Arthur O'Dwyer's "AtScopeExit" explained in
// https://www.youtube.com/watch?v=lKG1m2NkANM

// NOLINTBEGIN(*macro-usage*)

namespace ccjfix::utils {
template <typename Lam>
class AtScopeExit {
  Lam m_lam;
  bool m_armed{true};
public:
 AtScopeExit(const AtScopeExit &) = delete;
 AtScopeExit(AtScopeExit &&) = delete;
 AtScopeExit &operator=(const AtScopeExit &) = delete;
 AtScopeExit &operator=(AtScopeExit &&) = delete;
 AtScopeExit(Lam action) : m_lam(static_cast<Lam&&>(action)) {}
 ~AtScopeExit() { if (m_armed) m_lam(); }
 void release() { m_armed = false; }
};
}

#define TOKEN_PASTEx(x,y) x ## y
#define TOKEN_PASTE(x, y) TOKEN_PASTEx(x, y)

#define AUTO_INTERNAL(lname, aname, ...)                   \
  auto lname = [&]() { __VA_ARGS__; };                     \
  ccjfix::utils::AtScopeExit aname(lname)

// Run the statements at scope exit unless the named guard is release()d
#define AUTO_NAMED(name, ...)                              \
  AUTO_INTERNAL(TOKEN_PASTE(name, _func), name, __VA_ARGS__)
// NOLINTEND(*macro-usage*)
