// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_RPC_REGISTER_H
#define CIPHERBATCH_RPC_REGISTER_H

class CRPCTable;

/** Register ledger, settlement and registry RPC commands */
void RegisterSettlementRPCCommands(CRPCTable& tableRPC);

static inline void RegisterAllCoreRPCCommands(CRPCTable& tableRPC)
{
    RegisterSettlementRPCCommands(tableRPC);
}

#endif // CIPHERBATCH_RPC_REGISTER_H
