#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

#include <paysplitter/paysplitter.constants.hpp>

#include <string>
#include <vector>

using namespace std;
using namespace eosio;

class [[eosio::contract("paysplitter")]] paysplitter : public contract
{
public:
    using contract::contract;

    paysplitter(name self, name code, datastream<const char *> ds);

    ~paysplitter();

    static constexpr symbol CORE_SYM = symbol(CORE_SYMBOL_CODE, CORE_SYMBOL_PRECISION);

#pragma region Admin

    // Registers the payee set. Owner only, and only once.
    [[eosio::action]]
    void init(const vector<name> &payees, const vector<uint64_t> &shares);

    [[eosio::action]]
    void setowner(name new_owner);

#pragma endregion Admin

#pragma region Distribution

    // Pays `account` whatever it has accrued since its last release.
    [[eosio::action]]
    void release(name account);

    [[eosio::on_notify("eosio.token::transfer")]]
    void ondeposit(name from, name to, asset quantity, string memo);

#pragma endregion Distribution

#pragma region Investors

    [[eosio::action]]
    void addprojfees(name investor, asset fee);

    // Repays every active investor record, in registration order.
    [[eosio::action]]
    void reimburse();

#pragma endregion Investors

#pragma region Logs

    //NOTE: log actions only record their arguments in the action trace
    [[eosio::action]] void payeeadded(name account, uint64_t shares);

    [[eosio::action]] void paymentrel(name to, asset amount);

    [[eosio::action]] void paymentrecv(name from, asset amount);

    [[eosio::action]] void feesadded(name investor, asset fee);

    [[eosio::action]] void feerepaid(name investor, asset amount);

#pragma endregion Logs

#pragma region Tables

    struct [[eosio::table]] payee
    {
        name account;
        uint64_t idx;
        uint64_t shares;
        asset released;

        uint64_t primary_key() const { return account.value; }
        uint64_t by_index() const { return idx; }

        EOSLIB_SERIALIZE(payee, (account)(idx)(shares)(released))
    };

    struct [[eosio::table]] investor
    {
        name account;
        uint64_t seq;
        asset fee_owed;
        bool active = true;

        uint64_t primary_key() const { return account.value; }
        uint64_t by_seq() const { return seq; }

        EOSLIB_SERIALIZE(investor, (account)(seq)(fee_owed)(active))
    };

    struct [[eosio::table("config")]] splitcfg
    {
        name owner;

        EOSLIB_SERIALIZE(splitcfg, (owner))
    };

    struct [[eosio::table("ledger")]] ledgerstate
    {
        bool initialized = false;
        uint64_t total_shares = 0;
        uint64_t payee_count = 0;
        asset total_released;
        asset pool_balance;
        asset fee_pool;
        uint64_t investor_seq = 0;

        EOSLIB_SERIALIZE(ledgerstate, (initialized)(total_shares)(payee_count)(total_released)(pool_balance)(fee_pool)(investor_seq))
    };

    typedef multi_index<"payees"_n, payee,
        indexed_by<"byindex"_n, const_mem_fun<payee, uint64_t, &payee::by_index>>> payees_table;

    typedef multi_index<"investors"_n, investor,
        indexed_by<"byseq"_n, const_mem_fun<investor, uint64_t, &investor::by_seq>>> investors_table;

    typedef singleton<"config"_n, splitcfg> config_singleton;

    typedef singleton<"ledger"_n, ledgerstate> ledger_singleton;

#pragma endregion Tables

    using init_action = action_wrapper<"init"_n, &paysplitter::init>;
    using release_action = action_wrapper<"release"_n, &paysplitter::release>;
    using addprojfees_action = action_wrapper<"addprojfees"_n, &paysplitter::addprojfees>;
    using reimburse_action = action_wrapper<"reimburse"_n, &paysplitter::reimburse>;
    using setowner_action = action_wrapper<"setowner"_n, &paysplitter::setowner>;
    using payeeadded_action = action_wrapper<"payeeadded"_n, &paysplitter::payeeadded>;
    using paymentrel_action = action_wrapper<"paymentrel"_n, &paysplitter::paymentrel>;
    using paymentrecv_action = action_wrapper<"paymentrecv"_n, &paysplitter::paymentrecv>;
    using feesadded_action = action_wrapper<"feesadded"_n, &paysplitter::feesadded>;
    using feerepaid_action = action_wrapper<"feerepaid"_n, &paysplitter::feerepaid>;

private:
    config_singleton configuration;
    ledger_singleton ledger;
    ledgerstate _ledger;

    splitcfg getconfig();
    ledgerstate get_default_ledger();

    void add_payee(payees_table &payees, name account, uint64_t shares);
    void send_payout(name to, asset quantity, const string &memo);
};
