/**
 * @file ControlMessage.hpp
 * @brief Connection lifecycle messages exchanged as 1-byte datagrams.
 */

#ifndef CONTROL_MESSAGE_HPP
#define CONTROL_MESSAGE_HPP

#include "scs_udp_protocol.h"
#include <string>

struct ControlMessage {
    enum class Type {
        PING,            // keepalive, no registry effect
        NEW_CONNECTION,  // add sender to the registry
        DISCONNECTION,   // remove sender from the registry
        REQUEST_FRAME,   // pull hint, no mandatory effect
        GENERAL_OK,      // acknowledgment
        UNKNOWN          // any other byte, kept in 'raw'
    };

    Type type;
    uint8_t raw;

    /**
     * @brief Total mapping from the wire byte. Never fails.
     */
    static ControlMessage from_byte(uint8_t byte) {
        ControlMessage msg = {Type::UNKNOWN, byte};
        switch (byte) {
            case SCS_CTRL_PING:           msg.type = Type::PING; break;
            case SCS_CTRL_NEW_CONNECTION: msg.type = Type::NEW_CONNECTION; break;
            case SCS_CTRL_DISCONNECTION:  msg.type = Type::DISCONNECTION; break;
            case SCS_CTRL_REQUEST_FRAME:  msg.type = Type::REQUEST_FRAME; break;
            case SCS_CTRL_GENERAL_OK:     msg.type = Type::GENERAL_OK; break;
            default: break;
        }
        return msg;
    }

    static ControlMessage make(Type type) {
        return from_byte(type_to_byte(type));
    }

    uint8_t to_byte() const {
        return type == Type::UNKNOWN ? raw : type_to_byte(type);
    }

    std::string name() const {
        switch (type) {
            case Type::PING:           return "Ping";
            case Type::NEW_CONNECTION: return "NewConnection";
            case Type::DISCONNECTION:  return "Disconnection";
            case Type::REQUEST_FRAME:  return "RequestFrame";
            case Type::GENERAL_OK:     return "GeneralOk";
            default:                   return "Unknown(" + std::to_string(raw) + ")";
        }
    }

private:
    static uint8_t type_to_byte(Type type) {
        switch (type) {
            case Type::PING:           return SCS_CTRL_PING;
            case Type::NEW_CONNECTION: return SCS_CTRL_NEW_CONNECTION;
            case Type::DISCONNECTION:  return SCS_CTRL_DISCONNECTION;
            case Type::REQUEST_FRAME:  return SCS_CTRL_REQUEST_FRAME;
            case Type::GENERAL_OK:     return SCS_CTRL_GENERAL_OK;
            default:                   return 0;
        }
    }
};

inline bool operator==(const ControlMessage& a, const ControlMessage& b) {
    return a.type == b.type && a.raw == b.raw;
}

#endif // CONTROL_MESSAGE_HPP
