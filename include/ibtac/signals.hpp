#pragma once
#include <atomic>
#include <csignal>

namespace ibtac {

inline std::atomic_bool g_sigint{false};

// Routes SIGINT into g_sigint for the lifetime of the guard so Ctrl-C
// cancels the line being typed instead of ending the session.
struct SigintGuard {
  struct sigaction prev{};
  bool installed{false};

  SigintGuard(){
    struct sigaction sa{};
    sa.sa_handler = [](int){ g_sigint.store(true, std::memory_order_relaxed); };
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART: a pending read must return
    installed = sigaction(SIGINT, &sa, &prev) == 0;
  }
  ~SigintGuard(){
    if(installed) sigaction(SIGINT, &prev, nullptr);
    g_sigint.store(false, std::memory_order_relaxed);
  }
  SigintGuard(const SigintGuard&) = delete;
  SigintGuard& operator=(const SigintGuard&) = delete;
};

// true once per delivered SIGINT
inline bool take_interrupt(){
  return g_sigint.exchange(false, std::memory_order_relaxed);
}

} // namespace ibtac
