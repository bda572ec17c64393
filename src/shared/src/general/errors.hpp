#pragma once

#include "general/errors_forward.hpp"
#include <cstdint>
////////////////////////////////////
// LIST OF ERROR CODES            //
////////////////////////////////////
// These codes describe why a vault call was rejected. Every
// rejection aborts the whole top-level call.

// ERROR CODE RANGES
// -----------------
// The hundreds digit determines the error kind:
//   100-199: invalid input
//   200-299: unauthorized caller
//   300-399: insufficient funds
//   400-499: not found
//   500-599: invariant violation
//   600-699: reentrancy
//   700-799: external call failed
#define ADDITIONAL_ERRNO_MAP(XX)                                                  \
    XX(0, ENOERROR, "no error")                                                   \
    /*100 - 199: Invalid input*/                                                  \
    XX(101, ELENGTHMISMATCH, "input length mismatch")                             \
    XX(102, EZEROCONTROLLER, "invalid zero controller address")                   \
    XX(103, ESTRATEGYTYPE, "unknown pool strategy type")                          \
    XX(104, ETOKENINDEX, "token index out of range")                              \
    XX(105, ESAMETOKEN, "cannot swap same token")                                 \
    XX(106, EPOOLIDBITS, "malformed pool id")                                     \
    XX(107, EPAIRTOKENS, "pair pool supports exactly two tokens")                 \
    XX(108, EZEROTOKEN, "invalid zero token address")                             \
    XX(109, EMALFORMED, "malformed input")                                        \
    XX(110, EBADMULTIHOP, "malformed multihop amount chaining")                   \
    XX(111, ESWAPLIMIT, "swap limit exceeded")                                    \
    XX(112, EDUPLICATETOKEN, "duplicate token")                                   \
    XX(113, EBADADDRESS, "invalid address")                                       \
    XX(114, EBADFEE, "invalid fee percentage")                                    \
    XX(115, ENOSTRATEGY, "missing swap strategy")                                 \
    XX(116, ESELFAGENT, "cannot remove implicit self agent")                      \
    XX(117, ECUSTODYACCOUNT, "vault custody account cannot be a counterparty")    \
    /*200 - 299: Unauthorized*/                                                   \
    XX(201, ESENDERNOTAGENT, "caller is not an agent for the account")            \
    XX(202, ECALLERNOTCONTROLLER, "caller is not the pool controller")            \
    XX(203, ENOTMANAGER, "caller is not the investment manager")                  \
    XX(204, ENOTUNIVERSALMANAGER, "caller is not a universal agent manager")      \
    XX(205, EUNIVERSALAGENT, "universal agents cannot be revoked by users")       \
    XX(206, ENOTALLOWED, "caller is not allowed")                                 \
    /*300 - 399: Insufficient funds*/                                             \
    XX(301, EBALANCE, "insufficient balance")                                     \
    XX(302, EMANAGED, "insufficient managed balance")                             \
    XX(303, EPOOLLIQUIDITY, "insufficient pool liquidity")                        \
    XX(304, EFEEBALANCE, "insufficient collected fees")                           \
    /*400 - 499: Not found*/                                                      \
    XX(401, ENOPOOL, "pool does not exist")                                       \
    XX(402, ENOTOKEN, "token not present in pool")                                \
    XX(403, ENOMANAGER, "no investment manager authorized")                       \
    /*500 - 599: Invariant violation*/                                            \
    XX(501, EDUPLICATEPOOLID, "duplicate pool id")                                \
    XX(502, EBALANCEOVERFLOW, "balance overflow")                                 \
    XX(503, ESWAPFEE, "swap fee above maximum")                                   \
    XX(504, EFLASHFEE, "flash loan fee above maximum")                            \
    XX(505, EWITHDRAWFEE, "withdraw fee above maximum")                           \
    XX(506, EMANAGEDNONZERO, "managed balance is not zero")                       \
    XX(507, EPOOLINDEX, "pool index space exhausted")                             \
    /*600 - 699: Reentrancy*/                                                     \
    XX(601, EREENTRANCY, "reentrant call blocked")                                \
    /*700 - 799: External call failed*/                                           \
    XX(701, ESWAPREJECTED, "swap rejected by pool")                               \
    XX(702, EFLASHNOTREPAID, "flash loan not repaid")                             \
    XX(703, ETRANSFER, "token transfer failed")                                   \
    XX(704, EFLASHCALLBACK, "flash loan receiver failed")                         \
    XX(2000, EBUG, "bug-related error")

#define ERR_DEFINE(code, name, _) constexpr int32_t name = code;
ADDITIONAL_ERRNO_MAP(ERR_DEFINE)
#undef ERR_DEFINE
