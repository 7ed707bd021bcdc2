#ifndef PRINTBROKER_DOMAIN_CONTENT_DIGEST_H
#define PRINTBROKER_DOMAIN_CONTENT_DIGEST_H

#include <string>
#include <string_view>

#include "change_set.h"

namespace domain {

std::string Sha256Hex(std::string_view data);

// Seal stored with an approved change order: SHA-256 over the summary and the
// canonical change set.
std::string ChangeOrderDigest(std::string_view summary, const ChangeSet &changes);

}  // namespace domain

#endif  // PRINTBROKER_DOMAIN_CONTENT_DIGEST_H
