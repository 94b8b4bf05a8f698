#include "timer.hpp"
#include <cerrno>
#include <stdexcept>
#include <sys/timerfd.h>
#include <unistd.h>

Timer::Timer():
m_fd(-1)
{
}

Timer::~Timer()
{
    if (m_fd >= 0)
        close(m_fd);
}

void Timer::start(unsigned int period_ms, bool periodic)
{
    if (m_fd < 0) {
        m_fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
        if (m_fd < 0)
            throw std::runtime_error("Failed to create timer");
    }

    struct itimerspec val;
    val.it_value.tv_sec = period_ms / 1000;
    val.it_value.tv_nsec = (period_ms - val.it_value.tv_sec * 1000) * 1000 * 1000;
    val.it_interval.tv_sec = 0;
    val.it_interval.tv_nsec = 0;
    if (periodic)
        val.it_interval = val.it_value;

    if (timerfd_settime(m_fd, 0, &val, NULL) < 0)
        throw std::runtime_error("Failed to start timer");
}

void Timer::stop()
{
    if (m_fd < 0)
        return;

    struct itimerspec val;
    val.it_interval.tv_nsec = 0;
    val.it_interval.tv_sec = 0;
    val.it_value.tv_nsec = 0;
    val.it_value.tv_sec = 0;
    timerfd_settime(m_fd, 0, &val, NULL);
}

uint64_t Timer::consume()
{
    if (m_fd < 0)
        return 0;

    uint64_t count = 0;
    ssize_t ret = read(m_fd, &count, sizeof(count));
    if (ret != sizeof(count))
        return 0;

    return count;
}

int Timer::getFD() const
{
    return m_fd;
}
