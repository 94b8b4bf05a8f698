#ifndef TIMER_HPP
#define TIMER_HPP

#include <cstdint>

/* timerfd wrapper, meant to be polled */
class Timer {
public:
    Timer();
    virtual ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    void start(unsigned int period_ms, bool periodic = false);
    void stop();

    /**
     * @brief Acknowledge expirations
     *
     * @return number of expirations since last call, 0 if none
     */
    uint64_t consume();

    int getFD() const;

private:
    int m_fd;
};

#endif
