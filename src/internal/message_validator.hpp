#ifndef STEER_INTERNAL_MESSAGE_VALIDATOR_HPP
#define STEER_INTERNAL_MESSAGE_VALIDATOR_HPP

#include <steer/types.hpp>

namespace steer
{
namespace protocol
{

// Shape check: throws ProtocolError unless j is an object with a string "type".
void require_envelope(const json& j);

// Schema check for the known message kinds. Throws ValidationError naming every
// offending field. Unknown kinds are accepted as-is.
void validate_message(const json& j);

} // namespace protocol
} // namespace steer

#endif // STEER_INTERNAL_MESSAGE_VALIDATOR_HPP
