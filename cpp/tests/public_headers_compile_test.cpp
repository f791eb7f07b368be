#include <gtest/gtest.h>

// Every public header must compile when included together.

#include "touchseal/cli/commands.hpp"
#include "touchseal/cli/options.hpp"
#include "touchseal/codec/encoding.hpp"
#include "touchseal/codec/envelope.hpp"
#include "touchseal/codec/ssh_wire.hpp"
#include "touchseal/core/errors.hpp"
#include "touchseal/core/types.hpp"
#include "touchseal/credential/credential.hpp"
#include "touchseal/oracle/oracle.hpp"
#include "touchseal/oracle/ssh_signer.hpp"
#include "touchseal/seal/seal.hpp"
#include "touchseal/security/crypto.hpp"
#include "touchseal/security/hashing.hpp"
#include "touchseal/security/kdf.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
