// combat_collaborator.hpp
#pragma once

class Connection;

// What the session layer needs from the combat system during a transfer.
class CombatCollaborator {
public:
    virtual ~CombatCollaborator() = default;
    virtual bool is_in_combat(const Connection& connection) const = 0;
    // Re-points combat bookkeeping from `old_connection` to `new_connection`. May throw.
    virtual void handle_session_transfer(Connection& old_connection, Connection& new_connection) = 0;
};

// Used when no combat system is wired in: reads the flag off the attached record.
class RecordFlagCombat : public CombatCollaborator {
public:
    bool is_in_combat(const Connection& connection) const override;
    void handle_session_transfer(Connection& old_connection, Connection& new_connection) override;
};
