#pragma once

#include "network/reply.hpp"

#include <cstdint>

namespace memkv::command {

// Endpoint the dispatcher answers.  A network session in production, a
// recording stub in tests.
//
// deliver() is only used for replies produced outside the request that
// caused them: a blocked BLPOP/BRPOP being served by a later push or timing
// out.  Ordinary replies are returned from Dispatcher::execute().
class Client {
public:
    virtual ~Client() = default;

    [[nodiscard]] virtual uint64_t id() const noexcept = 0;

    virtual void deliver(Reply reply) = 0;
};

} // namespace memkv::command
