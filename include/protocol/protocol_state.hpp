#ifndef SFTPGW_PROTOCOL_STATE_HPP
#define SFTPGW_PROTOCOL_STATE_HPP

#include <ostream>
#include <string>

namespace sftpgw {
namespace protocol {

/**
 * ProtocolState tracks the lifecycle of one SFTP conversation.
 * Transitions only move forward; CLOSED is terminal.
 */
class ProtocolState {
public:
    /**
     * Protocol states:
     * AWAITING_VERSION - Connection accepted, only INIT is allowed
     * NEGOTIATED       - Version agreed, requests are served
     * CLOSED           - Transport gone or protocol violated, nothing is served
     */
    enum class State {
        AWAITING_VERSION,
        NEGOTIATED,
        CLOSED
    };

    ProtocolState() : current_state_(State::AWAITING_VERSION) {}

    State get_state() const { return current_state_; }

    bool is_closed() const { return current_state_ == State::CLOSED; }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::AWAITING_VERSION:
                return to == State::NEGOTIATED ||
                       to == State::CLOSED;

            case State::NEGOTIATED:
                return to == State::CLOSED;

            case State::CLOSED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::AWAITING_VERSION: return "AWAITING_VERSION";
            case State::NEGOTIATED:       return "NEGOTIATED";
            case State::CLOSED:           return "CLOSED";
            default:                      return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

inline std::ostream& operator<<(std::ostream& os, const ProtocolState::State& state) {
    os << ProtocolState::state_to_string(state);
    return os;
}

} // namespace protocol
} // namespace sftpgw

#endif // SFTPGW_PROTOCOL_STATE_HPP
