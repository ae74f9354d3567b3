#include <paysplitter/paysplitter.hpp>

void paysplitter::init(const vector<name> &payees, const vector<uint64_t> &shares)
{
    require_auth(getconfig().owner);
    check(!_ledger.initialized, "already initialized");
    check(payees.size() == shares.size(), "payees and shares length mismatch");
    check(payees.size() > 0, "no payees");

    payees_table payees_tbl(get_self(), get_self().value);
    for (size_t i = 0; i < payees.size(); i++)
    {
        add_payee(payees_tbl, payees[i], shares[i]);
    }

    _ledger.initialized = true;
    print("registered ", _ledger.payee_count, " payees with ", _ledger.total_shares, " total shares\n");
}

void paysplitter::add_payee(payees_table &payees, name account, uint64_t shares)
{
    check(account != name(), "payee account is null");
    check(account != get_self(), "contract cannot be its own payee");
    check(is_account(account), "payee is not a valid account");
    check(shares > 0, "shares must be positive");
    check(payees.find(account.value) == payees.end(), "payee already has shares");
    check(_ledger.total_shares + shares > _ledger.total_shares, "total shares overflow");

    payees.emplace(get_self(), [&](auto &p) {
        p.account = account;
        p.idx = _ledger.payee_count;
        p.shares = shares;
        p.released = asset(0, CORE_SYM);
    });

    _ledger.payee_count++;
    _ledger.total_shares += shares;

    payeeadded_action log(get_self(), {get_self(), "active"_n});
    log.send(account, shares);
}
