#pragma once

#include <cstdint>
#include <string>

#ifndef TESTER
#define VNAME eosio::name
#else
#define VNAME eosio::chain::name
#endif

// token contract that holds the pooled balance and moves payouts
static constexpr VNAME TOKEN_ACCOUNT = "eosio.token"_n;

// core token: TLOS with 4 decimals, same as the deposits notified by TOKEN_ACCOUNT
static constexpr const char *CORE_SYMBOL_CODE = "TLOS";
static constexpr uint8_t CORE_SYMBOL_PRECISION = 4;

static const std::string RELEASE_MEMO = "paysplitter release";
static const std::string REIMBURSE_MEMO = "paysplitter fee reimbursement";
