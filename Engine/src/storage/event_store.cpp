#include <storage/event_store.hpp>
#include <utils/logger.hpp>

namespace ChainReplay {

EventStore::Transaction::Transaction(EventStore& store) : store_(store) {
    store_.begin_transaction();
}

EventStore::Transaction::~Transaction() {
    if (committed_) return;
    try {
        store_.rollback();
    } catch (const std::exception& e) {
        Logger::warn(std::string("Rollback failed: ") + e.what());
    }
}

void EventStore::Transaction::commit() {
    store_.commit();
    committed_ = true;
}

} // namespace ChainReplay
