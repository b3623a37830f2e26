#include <Console/OutputChannel.hpp>
#include <iterator>

namespace InkWell {

void OutputChannel::push(ConsoleEvent event)
{
    std::lock_guard<std::mutex> l(m_mutex);
    m_events.push_back(std::move(event));
}

std::vector<ConsoleEvent> OutputChannel::drain()
{
    std::lock_guard<std::mutex> l(m_mutex);
    std::vector<ConsoleEvent> out(std::make_move_iterator(m_events.begin()),
                                  std::make_move_iterator(m_events.end()));
    m_events.clear();
    return out;
}

std::size_t OutputChannel::size() const
{
    std::lock_guard<std::mutex> l(m_mutex);
    return m_events.size();
}

} // namespace InkWell
