#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace lingua
{

// Multicast callback registry. Slots connected after an emission never see it
// (no replay). Emit runs slots on the calling thread, outside the lock, so a
// slot may connect or disconnect other slots.
template <typename... Args>
class Signal
{
public:
    using Slot = std::function<void(Args...)>;
    using Connection = std::uint64_t;

    Connection Connect(Slot slot)
    {
        std::lock_guard<std::mutex> lock(mu_);
        const Connection id = ++next_id_;
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    bool Disconnect(Connection id)
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (auto it = slots_.begin(); it != slots_.end(); ++it)
        {
            if (it->first == id)
            {
                slots_.erase(it);
                return true;
            }
        }
        return false;
    }

    void Emit(Args... args) const
    {
        std::vector<std::pair<Connection, Slot>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mu_);
            snapshot = slots_;
        }
        for (const auto& s : snapshot)
            s.second(args...);
    }

    size_t Size() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return slots_.size();
    }

private:
    mutable std::mutex                       mu_;
    std::vector<std::pair<Connection, Slot>> slots_;
    Connection                               next_id_ = 0;
};

} // namespace lingua
