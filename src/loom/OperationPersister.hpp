#ifndef SRC_LOOM_OPERATION_PERSISTER_HPP_
#define SRC_LOOM_OPERATION_PERSISTER_HPP_

#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace loom {

class WorkerPool;

struct PersistError {
    std::string message;
};

// The id the operation text was stored under, or the reason it couldn't be stored.
using PersistResult = std::variant<std::string, PersistError>;

// Stores operation text somewhere the server can later look it up by id. Persistence completes asynchronously, the
// callback may be called on any thread but is called exactly once per call to persist().
class OperationPersister {
public:
    OperationPersister() = default;
    virtual ~OperationPersister() = default;

    virtual void persist(std::string text, std::function<void(PersistResult)> callback) = 0;
};

// Uses the xxHash of the text as its id without storing it anywhere, the generated persisted query map is the store.
// Hashing runs on the WorkerPool.
class LocalPersister : public OperationPersister {
public:
    LocalPersister() = delete;
    explicit LocalPersister(std::shared_ptr<WorkerPool> workerPool);
    virtual ~LocalPersister() = default;

    void persist(std::string text, std::function<void(PersistResult)> callback) override;

private:
    std::shared_ptr<WorkerPool> m_workerPool;
};

} // namespace loom

#endif // SRC_LOOM_OPERATION_PERSISTER_HPP_
