#ifndef LIBRBDISCOVERY_HOSTRESOLVER_HPP
#define LIBRBDISCOVERY_HOSTRESOLVER_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace librbdiscovery {

class ResolutionError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

class HostResolver {
public:
	virtual ~HostResolver() = default;

	/**
	 * Resolves all addresses bound to `name` and returns the canonical host name of each, in the order the resolver
	 * returned the addresses.
	 *
	 * @throws ResolutionError if the name does not resolve to any address
	 */
	[[nodiscard]] virtual std::vector<std::string> resolve_host_names(std::string_view name) const = 0;
};

class AsioHostResolver : public HostResolver {
public:
	[[nodiscard]] std::vector<std::string> resolve_host_names(std::string_view name) const override;
};

}  // namespace librbdiscovery

#endif  // LIBRBDISCOVERY_HOSTRESOLVER_HPP
