#include "database/DBConnection.hpp"

#include <pqxx/pqxx>

using namespace es::database;

void DBConnection::initPreparedSyncJobs() const {
    conn_->prepare(
        "sync_job.upsert",
        R"SQL(
        INSERT INTO sync_jobs
            (job_id, resource_id, source_path, file_size, chunk_size, chunk_count,
             chunks_done, status, priority, created_at, updated_at, retry_count,
             error_message, remote_transfer_id, metadata, next_attempt_at, cancelled)
        VALUES
            ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, $17)
        ON CONFLICT (job_id)
        DO UPDATE SET
            chunks_done        = EXCLUDED.chunks_done,
            status             = EXCLUDED.status,
            priority           = EXCLUDED.priority,
            updated_at         = EXCLUDED.updated_at,
            retry_count        = EXCLUDED.retry_count,
            error_message      = EXCLUDED.error_message,
            remote_transfer_id = EXCLUDED.remote_transfer_id,
            metadata           = EXCLUDED.metadata,
            next_attempt_at    = EXCLUDED.next_attempt_at,
            cancelled          = EXCLUDED.cancelled
    )SQL");

    conn_->prepare("sync_job.get", "SELECT * FROM sync_jobs WHERE job_id = $1");

    conn_->prepare(
        "sync_job.next_eligible",
        R"SQL(
        SELECT *
          FROM sync_jobs
         WHERE status = 'queued'
            OR (status = 'paused'
                AND NOT cancelled
                AND (next_attempt_at IS NULL OR next_attempt_at <= $1))
         ORDER BY priority ASC, created_at ASC, job_id ASC
    )SQL");

    conn_->prepare("sync_job.list_by_status",
                   "SELECT * FROM sync_jobs WHERE status = $1 ORDER BY priority ASC, created_at ASC, job_id ASC");

    conn_->prepare("sync_job.summary",
                   "SELECT status, COUNT(*) AS jobs, COALESCE(SUM(file_size), 0) AS bytes "
                   "FROM sync_jobs GROUP BY status");

    conn_->prepare(
        "sync_job.recover_interrupted",
        R"SQL(
        UPDATE sync_jobs
           SET status = 'paused', next_attempt_at = NULL, updated_at = $1
         WHERE status = 'transferring'
        RETURNING job_id
    )SQL");

    conn_->prepare("sync_job.try_worker_lease", "SELECT pg_try_advisory_lock($1) AS acquired");
}
