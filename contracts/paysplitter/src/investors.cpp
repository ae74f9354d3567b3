#include <paysplitter/paysplitter.hpp>

void paysplitter::addprojfees(name investor, asset fee)
{
    require_auth(getconfig().owner);
    check(investor != name(), "investor account is null");
    check(investor != get_self(), "contract cannot be its own investor");
    check(is_account(investor), "investor is not a valid account");
    check(fee.is_valid() && fee.symbol == CORE_SYM, "fee must be in the core token");
    check(fee.amount > 0, "fee must be positive");

    investors_table investors(get_self(), get_self().value);
    auto itr = investors.find(investor.value);

    if (itr == investors.end())
    {
        investors.emplace(get_self(), [&](auto &i) {
            i.account = investor;
            i.seq = _ledger.investor_seq;
            i.fee_owed = fee;
            i.active = true;
        });
    }
    else
    {
        // a cleared record goes back to the end of the queue
        check(!itr->active, "investor already has fees pending");
        investors.modify(itr, same_payer, [&](auto &i) {
            i.seq = _ledger.investor_seq;
            i.fee_owed = fee;
            i.active = true;
        });
    }

    _ledger.investor_seq++;
    _ledger.fee_pool += fee;

    feesadded_action log(get_self(), {get_self(), "active"_n});
    log.send(investor, fee);
}

void paysplitter::reimburse()
{
    require_auth(getconfig().owner);
    check(_ledger.fee_pool.amount > 0, "no project fees owed");
    check(_ledger.pool_balance.amount > 0, "pool balance is empty");
    check(_ledger.pool_balance >= _ledger.fee_pool, "pool balance is below fees owed");

    investors_table investors(get_self(), get_self().value);
    auto investors_by_seq = investors.get_index<"byseq"_n>();

    uint64_t reimbursed = 0;
    for (auto itr = investors_by_seq.begin(); itr != investors_by_seq.end(); itr++)
    {
        if (!itr->active)
            continue;

        const asset owed = itr->fee_owed;
        const name to = itr->account;
        investors_by_seq.modify(itr, same_payer, [&](auto &i) {
            i.fee_owed.amount = 0;
            i.active = false;
        });
        _ledger.fee_pool -= owed;
        _ledger.pool_balance -= owed;

        print("reimbursing ", owed, " to ", to, "\n");
        send_payout(to, owed, REIMBURSE_MEMO);

        feerepaid_action log(get_self(), {get_self(), "active"_n});
        log.send(to, owed);
        reimbursed++;
    }

    print("reimbursed ", reimbursed, " investors, pool balance: ", _ledger.pool_balance, "\n");
}
