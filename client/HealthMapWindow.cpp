#include "HealthMapWindow.hpp"
#include "DisplayName.hpp"
#include <QFont>
#include <QFontMetrics>
#include <QPainter>
#include <QVBoxLayout>
#include <algorithm>

namespace devwatch::client
{
    namespace
    {
        constexpr int RADIUS_UP = 40;
        constexpr int RADIUS_DOWN = 46;
        constexpr qreal FULL_ALPHA = 1.0;
        constexpr qreal DIM_ALPHA = 0.25;
        constexpr int ROW_HEIGHT = 190;
        constexpr int MIN_CELL_WIDTH = 150;
        constexpr int TITLE_HEIGHT = 60;
    }

    HealthMapView::HealthMapView(std::vector<std::string> hostnameSuffixes, QWidget *parent)
        : QWidget(parent), m_suffixes(std::move(hostnameSuffixes))
    {
        setAutoFillBackground(true);
        QPalette pal = palette();
        pal.setColor(QPalette::Window, Qt::black);
        setPalette(pal);
        setMinimumSize(800, 400);
    }

    void HealthMapView::SetSnapshot(engine::SnapshotPtr snapshot)
    {
        m_snapshot = std::move(snapshot);
        update();
    }

    void HealthMapView::paintEvent(QPaintEvent *)
    {
        QPainter painter(this);
        painter.setRenderHint(QPainter::Antialiasing);

        QFont titleFont = font();
        titleFont.setPointSize(16);
        titleFont.setBold(true);
        painter.setFont(titleFont);
        painter.setPen(Qt::white);
        painter.drawText(QRect(0, 0, width(), TITLE_HEIGHT), Qt::AlignCenter, "Live Network Device Health");

        if (!m_snapshot || m_snapshot->entries.empty())
            return;

        QFont labelFont = font();
        labelFont.setPointSize(10);
        labelFont.setBold(true);
        QFontMetrics labelMetrics(labelFont);

        std::vector<QString> labels;
        int widest = 0;
        for (const auto &entry : m_snapshot->entries)
        {
            QString label = QString::fromStdString(WrapLabel(DisplayName(entry, m_suffixes)) + "\n" + entry.Target());
            for (const auto &line : label.split('\n'))
                widest = std::max(widest, labelMetrics.horizontalAdvance(line));
            labels.push_back(label);
        }

        const int count = static_cast<int>(m_snapshot->entries.size());
        const int columns = std::min(COLUMNS, count);
        const int cellWidth = std::max(MIN_CELL_WIDTH, widest + 40);
        const int gridWidth = columns * cellWidth;
        const int left = std::max(0, (width() - gridWidth) / 2);

        QFont statusFont = font();
        statusFont.setPointSize(12);
        statusFont.setBold(true);

        for (int i = 0; i < count; ++i)
        {
            const auto &entry = m_snapshot->entries[static_cast<std::size_t>(i)];
            const int cx = left + (i % COLUMNS) * cellWidth + cellWidth / 2;
            const int cy = TITLE_HEIGHT + (i / COLUMNS) * ROW_HEIGHT + RADIUS_DOWN + 10;

            const bool up = entry.reachable;
            const qreal alpha = (up || entry.blinkPhase) ? FULL_ALPHA : DIM_ALPHA;
            const int radius = up ? RADIUS_UP : RADIUS_DOWN;

            painter.setOpacity(alpha);
            painter.setPen(QPen(Qt::white, 1.8));
            painter.setBrush(up ? QColor(Qt::green) : QColor(Qt::red));
            painter.drawEllipse(QPoint(cx, cy), radius, radius);

            painter.setFont(statusFont);
            painter.setPen(up ? Qt::white : Qt::yellow);
            painter.drawText(QRect(cx - radius, cy - radius, radius * 2, radius * 2), Qt::AlignCenter, up ? "UP" : "DOWN");

            painter.setOpacity(1.0);
            painter.setFont(labelFont);
            const QRect textRect = labelMetrics.boundingRect(QRect(0, 0, cellWidth - 20, ROW_HEIGHT), Qt::AlignCenter, labels[static_cast<std::size_t>(i)]);
            QRect box(cx - textRect.width() / 2 - 6, cy + RADIUS_DOWN + 10, textRect.width() + 12, textRect.height() + 8);
            painter.setPen(Qt::NoPen);
            painter.setBrush(Qt::white);
            painter.drawRoundedRect(box, 6, 6);
            painter.setPen(Qt::black);
            painter.drawText(box, Qt::AlignCenter, labels[static_cast<std::size_t>(i)]);
        }
    }

    HealthMapWindow::HealthMapWindow(std::shared_ptr<SnapshotQueue> queue, std::vector<std::string> hostnameSuffixes,
                                     QWidget *parent)
        : QMainWindow(parent), m_queue(std::move(queue))
    {
        setupUi(std::move(hostnameSuffixes));

        m_pollTimer = new QTimer(this);
        connect(m_pollTimer, &QTimer::timeout, this, &HealthMapWindow::pollSnapshots);
        m_pollTimer->start(50);
    }

    void HealthMapWindow::setupUi(std::vector<std::string> hostnameSuffixes)
    {
        auto central = new QWidget();
        auto layout = new QVBoxLayout(central);

        m_view = new HealthMapView(std::move(hostnameSuffixes));
        layout->addWidget(m_view, 1);

        m_statsLabel = new QLabel("Waiting for first poll...");
        layout->addWidget(m_statsLabel);

        setCentralWidget(central);
        setWindowTitle("devwatch");
        resize(1400, 800);
    }

    void HealthMapWindow::pollSnapshots()
    {
        engine::SnapshotPtr snapshot = m_queue->TakeLatest();
        if (!snapshot)
            return;

        int online = 0;
        for (const auto &entry : snapshot->entries)
        {
            if (entry.reachable)
                ++online;
        }

        m_statsLabel->setText(QString("Cycle %1 | %2 of %3 devices up")
                                  .arg(static_cast<qulonglong>(snapshot->cycle))
                                  .arg(online)
                                  .arg(snapshot->entries.size()));
        m_view->SetSnapshot(std::move(snapshot));
    }
}
