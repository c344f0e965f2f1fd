// combat_collaborator.cpp
#include "combat_collaborator.hpp"
#include "connection.hpp"
#include "logger.hpp"

bool RecordFlagCombat::is_in_combat(const Connection& connection) const {
    const PlayerRecord* record = connection.record();
    return record && record->in_combat;
}

void RecordFlagCombat::handle_session_transfer(Connection& old_connection, Connection& new_connection) {
    old_connection.transfer_context().transfer_in_progress = true;
    new_connection.transfer_context().is_session_transfer = true;
    if (PlayerRecord* record = new_connection.record()) record->in_combat = true;
    Logger::instance().info("Combat state carried over", { {"from", old_connection.id()}, {"to", new_connection.id()} });
}
