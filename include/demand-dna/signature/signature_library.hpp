#pragma once

#include "demand-dna/signature/signature_extractor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace demanddna::signature {

/**
 * @class SignatureLibrary
 * @brief Named collection of extracted shock signatures, in insertion order.
 */
class SignatureLibrary {
public:
	/**
	 * @brief Stores a signature.
	 * @throws std::invalid_argument if the name is empty or already taken.
	 */
	void add(ShockSignature signature);

	/// Signature called @p name, if any.
	std::optional<ShockSignature> find(const std::string &name) const;

	/// Removes the signature called @p name; returns whether one was removed.
	bool remove(const std::string &name);

	const std::vector<ShockSignature> &signatures() const noexcept {
		return signatures_;
	}

	std::size_t size() const noexcept {
		return signatures_.size();
	}

	bool empty() const noexcept {
		return signatures_.empty();
	}

private:
	std::vector<ShockSignature> signatures_;
};

} // namespace demanddna::signature
