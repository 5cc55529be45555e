#pragma once

#include "common/types.h"
#include "runtime/account_view.h"
#include "runtime/data_layout.h"

namespace keel {
namespace cpi {

using namespace keel::common;
using runtime::AccountView;

/// Bytes of account metadata charged for rent on top of the data
constexpr uint64_t ACCOUNT_STORAGE_OVERHEAD = 128;

/// Default rent rate in lamports per byte-year
constexpr uint64_t LAMPORTS_PER_BYTE_YEAR = 3480;

/// Years of rent an account must hold to be exempt
constexpr uint64_t EXEMPTION_THRESHOLD_YEARS = 2;

/// Minimum balance for an account of `space` data bytes to be rent exempt
Lamports rent_exempt_minimum(uint64_t space);

/**
 * @brief Move lamports between two accounts directly in the buffer
 *
 * Only valid when the executing program owns `from`. Fails with
 * InvalidInput on insufficient balance or overflow; nothing is written then.
 */
Result<bool> transfer_lamports(AccountView &from, AccountView &to, Lamports amount);

/**
 * @brief Close a program-owned account
 *
 * All lamports go to `destination`, the data is zeroed and truncated and
 * ownership returns to the system program.
 */
Result<bool> close_account(AccountView &account, AccountView &destination);

/// Write the layout's account discriminator into the first eight data bytes
Result<bool> write_discriminator(AccountView &account, const runtime::DataLayout &layout);

/// True for an account that holds no lamports and no data
bool is_uninitialized(const AccountView &account);

} // namespace cpi
} // namespace keel
