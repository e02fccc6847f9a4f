#include "demand-dna/signature/signature_library.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace demanddna::signature {

void SignatureLibrary::add(ShockSignature signature) {
	if (signature.name.empty()) {
		throw std::invalid_argument("Signatures need a name.");
	}
	if (find(signature.name)) {
		throw std::invalid_argument("A signature named '" + signature.name + "' already exists.");
	}
	signatures_.push_back(std::move(signature));
}

std::optional<ShockSignature> SignatureLibrary::find(const std::string &name) const {
	const auto it = std::find_if(signatures_.begin(), signatures_.end(),
	                             [&name](const ShockSignature &s) { return s.name == name; });
	if (it == signatures_.end()) {
		return std::nullopt;
	}
	return *it;
}

bool SignatureLibrary::remove(const std::string &name) {
	const auto it = std::find_if(signatures_.begin(), signatures_.end(),
	                             [&name](const ShockSignature &s) { return s.name == name; });
	if (it == signatures_.end()) {
		return false;
	}
	signatures_.erase(it);
	return true;
}

} // namespace demanddna::signature
