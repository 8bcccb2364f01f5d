// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_CONSENSUS_VALIDATION_H
#define DUTCHX_CONSENSUS_VALIDATION_H

#include <string>

/**
 * Reject codes
 *
 * Every failed check carries one of these plus a stable, machine-readable
 * reject reason (e.g. "permit-nonce-reused"). Callers and tests compare the
 * reason string; the code only groups reasons by category.
 */
static const unsigned char REJECT_INVALID = 0x10;      //!< structural: malformed or inconsistent data
static const unsigned char REJECT_DUPLICATE = 0x12;    //!< nonce or settlement already used
static const unsigned char REJECT_UNAUTHORIZED = 0x44; //!< bad signature, wrong caller or wrong relay
static const unsigned char REJECT_TIMING = 0x45;       //!< deadline passed or window not reached
static const unsigned char REJECT_POLICY = 0x46;       //!< hook, fee or state-machine rule rejected it

/** Capture information about validation of an order or a settlement transition */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< the operation was rejected
        MODE_ERROR,   //!< run-time error
    } mode;
    int nDoS;
    std::string strRejectReason;
    unsigned int chRejectCode;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), nDoS(0), chRejectCode(0) {}

    bool DoS(int level, bool ret = false, unsigned int chRejectCodeIn = 0, const std::string& strRejectReasonIn = "", const std::string& strDebugMessageIn = "")
    {
        chRejectCode = chRejectCodeIn;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        if (mode == MODE_ERROR)
            return ret;
        nDoS += level;
        mode = MODE_INVALID;
        return ret;
    }

    bool Invalid(bool ret = false, unsigned int _chRejectCode = 0, const std::string& _strRejectReason = "", const std::string& _strDebugMessage = "")
    {
        return DoS(0, ret, _chRejectCode, _strRejectReason, _strDebugMessage);
    }

    bool Error(const std::string& strRejectReasonIn)
    {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        mode = MODE_ERROR;
        return false;
    }

    bool IsValid() const { return mode == MODE_VALID; }
    bool IsInvalid() const { return mode == MODE_INVALID; }
    bool IsError() const { return mode == MODE_ERROR; }

    bool IsInvalid(int& nDoSOut) const
    {
        if (IsInvalid()) {
            nDoSOut = nDoS;
            return true;
        }
        return false;
    }

    unsigned int GetRejectCode() const { return chRejectCode; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
};

#endif // DUTCHX_CONSENSUS_VALIDATION_H
