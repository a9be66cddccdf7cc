#pragma once
#include <functional>
#include <string>
#include <system_error>
#include <vector>
#include "contract.hpp"

namespace mender {

// Invoked before a new signed revision is sent to a host.
using RevisionSaver =
    std::function<std::error_code(const FileContractRevision&, const std::vector<Hash>&)>;

// Keeps the last known-good revision of each contract on disk so that a
// crash during revision exchange leaves a record to reconcile against.
class FileRevisionStore {
public:
    explicit FileRevisionStore(std::string dir);

    std::error_code save(const FileContractRevision& rev, const std::vector<Hash>& roots);
    std::error_code load(const Hash& contract_id, FileContractRevision& rev,
                         std::vector<Hash>& roots) const;
    std::string path_for(const Hash& contract_id) const;
    // Contracts with a record on disk, for reconciling after a restart.
    std::vector<Hash> stored_ids() const;

    RevisionSaver saver();

private:
    std::string dir_;
};

} // namespace mender
