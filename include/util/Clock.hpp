#pragma once
#include <chrono>
#include <thread>

namespace autogrow::util {

// All blocking waits go through here so tests can skip them
class IClock {
public:
  virtual ~IClock() = default;
  virtual void sleep_for(std::chrono::seconds d) = 0;
};

class SteadyClock : public IClock {
public:
  void sleep_for(std::chrono::seconds d) override { std::this_thread::sleep_for(d); }
};

} // namespace autogrow::util
