#ifndef FEDSYNC_ACCESS_CONTROLLER_HPP
#define FEDSYNC_ACCESS_CONTROLLER_HPP

#include <string>

namespace fedsync::federation
{
    /**
     * @brief Write authorization predicate of the access control collaborator.
     * Actors are identified by their site address (public key).
     */
    class AccessController
    {
    public:
        virtual ~AccessController() = default;

        virtual bool CanWrite( const std::string &actorKey ) const = 0;
    };
} // namespace fedsync::federation

#endif // FEDSYNC_ACCESS_CONTROLLER_HPP
