#include <paysplitter/paysplitter.hpp>

paysplitter::paysplitter(name self, name code, datastream<const char *> ds) : contract(self, code, ds),
                                                                              configuration(self, self.value),
                                                                              ledger(self, self.value)
{
    if (!configuration.exists())
    {
        configuration.set(splitcfg{
                              self, // owner
                          },
                          self);
    }

    _ledger = ledger.exists() ? ledger.get() : get_default_ledger();
}

paysplitter::~paysplitter()
{
    ledger.set(_ledger, get_self());
}

paysplitter::splitcfg paysplitter::getconfig()
{
    return configuration.get();
}

paysplitter::ledgerstate paysplitter::get_default_ledger()
{
    ledgerstate state;
    state.total_released = asset(0, CORE_SYM);
    state.pool_balance = asset(0, CORE_SYM);
    state.fee_pool = asset(0, CORE_SYM);
    return state;
}

void paysplitter::setowner(name new_owner)
{
    auto config = getconfig();
    require_auth(config.owner);
    check(is_account(new_owner), "new owner is not a valid account");

    config.owner = new_owner;
    configuration.set(config, get_self());
}

void paysplitter::ondeposit(name from, name to, asset quantity, string memo)
{
    // outgoing payouts notify us too
    if (from == get_self() || to != get_self())
        return;

    check(quantity.symbol == CORE_SYM, "only core token deposits accepted");

    _ledger.pool_balance += quantity;
    print("deposit from ", from, ": ", quantity, ", pool balance: ", _ledger.pool_balance, "\n");

    paymentrecv_action log(get_self(), {get_self(), "active"_n});
    log.send(from, quantity);
}

void paysplitter::send_payout(name to, asset quantity, const string &memo)
{
    action(permission_level{get_self(), "active"_n}, TOKEN_ACCOUNT, "transfer"_n, make_tuple(get_self(), to, quantity, memo)).send();
}

void paysplitter::payeeadded(name account, uint64_t shares)
{
    require_auth(get_self());
}

void paysplitter::paymentrel(name to, asset amount)
{
    require_auth(get_self());
}

void paysplitter::paymentrecv(name from, asset amount)
{
    require_auth(get_self());
}

void paysplitter::feesadded(name investor, asset fee)
{
    require_auth(get_self());
}

void paysplitter::feerepaid(name investor, asset amount)
{
    require_auth(get_self());
}
