#include <paysplitter/paysplitter.hpp>

void paysplitter::release(name account)
{
    require_auth(account);

    payees_table payees(get_self(), get_self().value);
    auto itr = payees.find(account.value);
    check(itr != payees.end() && itr->shares > 0, "account has no shares");

    // everything the pool has ever held for payees, paid out or not
    const uint128_t total_received = uint128_t(_ledger.pool_balance.amount) + uint128_t(_ledger.total_released.amount);
    const int64_t entitlement = int64_t(total_received * itr->shares / _ledger.total_shares);
    print("total_received:", uint64_t(total_received), " * shares:", itr->shares, " / total_shares:", _ledger.total_shares, " = entitlement:", entitlement, "\n");

    //NOTE: reimbursements shrink the pool without counting as released, so entitlement can fall below released
    check(entitlement > itr->released.amount, "account is not due payment");
    const asset payment = asset(entitlement - itr->released.amount, CORE_SYM);
    check(payment <= _ledger.pool_balance, "pool balance is below payment due");

    payees.modify(itr, same_payer, [&](auto &p) {
        p.released += payment;
    });
    _ledger.total_released += payment;
    _ledger.pool_balance -= payment;

    print("releasing ", payment, " to ", account, "\n");
    send_payout(account, payment, RELEASE_MEMO);

    paymentrel_action log(get_self(), {get_self(), "active"_n});
    log.send(account, payment);
}
