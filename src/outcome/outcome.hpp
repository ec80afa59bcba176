
#ifndef FEDSYNC_OUTCOME_HPP
#define FEDSYNC_OUTCOME_HPP

#include <libp2p/outcome/outcome.hpp>

namespace outcome
{
    using libp2p::outcome::result;
    using libp2p::outcome::success;
    using libp2p::outcome::failure;
}

#endif // FEDSYNC_OUTCOME_HPP
