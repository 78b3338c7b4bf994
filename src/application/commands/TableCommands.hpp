/**
 * @file TableCommands.hpp
 * @brief Commands for the Table and DataStore registries.
 */

#pragma once

#include "application/Command.hpp"

namespace geoflow::application::commands {

/** ReadTableFromDelimitedFile(InputFile, Delimiter, TableID, IfTableIDExists). */
class ReadTableFromDelimitedFile : public Command {
public:
    ReadTableFromDelimitedFile();

protected:
    void checkParameters(const domain::PropertyStore& properties) override;
    void runCommand(WorkflowContext& context) override;
};

/** WriteTableToDelimitedFile(TableID, OutputFile, Delimiter, WriteHeaderRow). */
class WriteTableToDelimitedFile : public Command {
public:
    WriteTableToDelimitedFile();

protected:
    void checkParameters(const domain::PropertyStore& properties) override;
    void runCommand(WorkflowContext& context) override;
};

/** OpenDataStore(DataStoreID, Folder, Delimiter, IfDataStoreIDExists). */
class OpenDataStore : public Command {
public:
    OpenDataStore();

protected:
    void checkParameters(const domain::PropertyStore& properties) override;
    void runCommand(WorkflowContext& context) override;
};

/** ReadTableFromDataStore(DataStoreID, DataStoreTable, TableID, IfTableIDExists). */
class ReadTableFromDataStore : public Command {
public:
    ReadTableFromDataStore();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** CloseDataStore(DataStoreID). */
class CloseDataStore : public Command {
public:
    CloseDataStore();

protected:
    void runCommand(WorkflowContext& context) override;
};

} // namespace geoflow::application::commands
