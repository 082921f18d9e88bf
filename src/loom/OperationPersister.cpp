#include "loom/OperationPersister.hpp"

#include "loom/Hash.hpp"
#include "loom/WorkerPool.hpp"

#include <cassert>

namespace loom {

LocalPersister::LocalPersister(std::shared_ptr<WorkerPool> workerPool): m_workerPool(std::move(workerPool)) {
    assert(m_workerPool);
}

void LocalPersister::persist(std::string text, std::function<void(PersistResult)> callback) {
    if (text.empty()) {
        callback(PersistError{ "Refusing to persist empty operation text" });
        return;
    }

    m_workerPool->enqueue([text = std::move(text), callback = std::move(callback)]() {
        callback(PersistResult(hashToString(hash(text))));
    });
}

} // namespace loom
