#include "ff1/net/NetService.hpp"
#include "ff1/log/Log.hpp"

namespace ff1::net {

namespace {
NetService& static_service() {
    static NetService service;
    return service;
}
} // namespace

NetService::NetService()
: io_(std::make_shared<asio::io_context>())
, work_guard_(asio::make_work_guard(*io_))
, t_([this]{ io_->run(); })
{
    logInfo("[NetService] I/O thread started\n");
}

NetService::~NetService() {
    work_guard_.reset();
    io_->stop();
    if (t_.joinable()) t_.join();
}

asio::io_context& io_context() {
    return *static_service().io();
}

} // namespace ff1::net
