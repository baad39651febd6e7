#pragma once

#include <QString>
#include <QStringList>

namespace lector {

// Lazily pulled sequence of text segments
class SegmentSource
{
public:
    virtual ~SegmentSource() = default;

    // false once exhausted
    virtual bool next(QString* text) = 0;
};

class ListSegmentSource : public SegmentSource
{
public:
    explicit ListSegmentSource(QStringList texts) : m_texts(std::move(texts)) {}

    bool next(QString* text) override
    {
        if (m_position >= m_texts.size()) {
            return false;
        }
        *text = m_texts.at(m_position++);
        return true;
    }

private:
    QStringList m_texts;
    int m_position = 0;
};

} // namespace lector
